#pragma once
#include "cas.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace cas {

enum class ScanStatus
{
    DONE,
    TRUNCATED_HEADER,
    TRUNCATED_PAYLOAD,
};

// Outcome of ChunkReader::scan(): everything that parsed before the stream broke
struct ScanResult
{
    std::vector<Chunk> chunks;
    size_t consumed = 0;  // bytes covered by complete chunks
    ScanStatus status = ScanStatus::DONE;
    std::optional<std::string> error;

    bool ok() const { return status == ScanStatus::DONE; }
};

/**
 * Walks a CAS byte stream chunk by chunk using only the declared lengths.
 *
 * The reader does not own the bytes; the buffer must outlive it. Any tag is
 * accepted verbatim.
 */
class ChunkReader
{
    std::span<const uint8_t> source;
    size_t cursor = 0;

public:
    explicit ChunkReader(std::span<const uint8_t> src) : source(src) {}

    /**
     * Parse the whole stream.
     * @throws TruncatedHeaderError if the stream ends inside a header
     * @throws TruncatedPayloadError if a payload runs past the end
     * No chunks are returned when either is thrown.
     */
    std::vector<Chunk> read();

    /// Like read(), but reports a broken stream in the result instead of throwing
    ScanResult scan();

private:
    bool next(std::vector<Chunk>& chunks);
    constexpr bool is_eof() const { return cursor >= source.size(); }
    constexpr size_t remaining() const { return source.size() - cursor; }
};

/// Shorthand for ChunkReader(bytes).read()
std::vector<Chunk> parse(std::span<const uint8_t> bytes);

} // namespace cas
