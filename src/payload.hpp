#pragma once
#include "cas.hpp"
#include <string>
#include <vector>

namespace cas {

/**
 * @brief Program image as sent over SIO: every `data` payload, in order
 *
 * Turbo `pwmd` blocks are an alternate encoding of the program and are
 * not part of this image.
 */
std::vector<uint8_t> to_byte_array(const std::vector<Chunk>& chunks);

/**
 * @brief Re-serialize every chunk (header + payload) in stream order
 *
 * For a well-formed stream, to_all_bytes(parse(bytes)) == bytes.
 */
std::vector<uint8_t> to_all_bytes(const std::vector<Chunk>& chunks);

/// Payload of each `data` chunk as a separate block
std::vector<std::vector<uint8_t>> data_blocks(const std::vector<Chunk>& chunks);

struct ChunkInfo
{
    size_t index;
    std::string type;
    ChunkType kind;
    uint16_t length;
    uint16_t aux;
};

std::vector<ChunkInfo> chunk_info(const std::vector<Chunk>& chunks);

} // namespace cas
