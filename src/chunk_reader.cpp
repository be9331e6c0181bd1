#include "chunk_reader.hpp"
#include "errors.hpp"
#include <algorithm>

namespace cas {

// Reads one chunk at the cursor. Returns false on a clean end of stream.
bool ChunkReader::next(std::vector<Chunk>& chunks) {
    if (is_eof()) return false;

    if (remaining() < HEADER_SIZE) {
        throw TruncatedHeaderError(chunks.size(), cursor, remaining());
    }

    const uint8_t* p = source.data() + cursor;
    Chunk chunk;
    std::copy(p, p + TAG_SIZE, chunk.header.type.begin());
    chunk.header.length = read_le16(p + 4);
    chunk.header.aux = read_le16(p + 6);

    const size_t available = remaining() - HEADER_SIZE;
    if (available < chunk.header.length) {
        throw TruncatedPayloadError(chunks.size(), cursor, chunk.header.length, available);
    }

    const uint8_t* payload = p + HEADER_SIZE;
    chunk.data.assign(payload, payload + chunk.header.length);
    cursor += HEADER_SIZE + chunk.header.length;

    chunks.push_back(std::move(chunk));
    return true;
}

std::vector<Chunk> ChunkReader::read() {
    cursor = 0;
    std::vector<Chunk> chunks;
    while (next(chunks)) {}
    return chunks;
}

ScanResult ChunkReader::scan() {
    cursor = 0;
    ScanResult result;
    try {
        while (next(result.chunks)) {}
    } catch (const TruncatedHeaderError& e) {
        result.status = ScanStatus::TRUNCATED_HEADER;
        result.error = e.what();
    } catch (const TruncatedPayloadError& e) {
        result.status = ScanStatus::TRUNCATED_PAYLOAD;
        result.error = e.what();
    }
    result.consumed = cursor;
    return result;
}

std::vector<Chunk> parse(std::span<const uint8_t> bytes) {
    ChunkReader reader(bytes);
    return reader.read();
}

} // namespace cas
