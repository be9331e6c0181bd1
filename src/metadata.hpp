#pragma once
#include "cas.hpp"
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace cas {

struct Metadata
{
    std::optional<std::string> description;   // first FUJI chunk
    uint16_t baudrate = DEFAULT_BAUDRATE;     // first baud chunk
    size_t chunk_count = 0;
    size_t data_block_count = 0;              // `data` chunks only, not pwmd
};

Metadata derive_metadata(const std::vector<Chunk>& chunks);

/**
 * Decode bytes as UTF-8 into a well-formed UTF-8 string.
 *
 * Every maximal invalid subsequence is replaced by U+FFFD, so malformed
 * input never fails the decode.
 */
std::string decode_utf8_lossy(std::span<const uint8_t> bytes);

} // namespace cas
