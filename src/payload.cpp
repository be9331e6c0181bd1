#include "payload.hpp"

namespace cas {

std::vector<uint8_t> to_byte_array(const std::vector<Chunk>& chunks) {
    size_t total = 0;
    for (const auto& chunk : chunks) {
        if (chunk.is(TAG_DATA)) total += chunk.data.size();
    }

    std::vector<uint8_t> out;
    out.reserve(total);
    for (const auto& chunk : chunks) {
        if (chunk.is(TAG_DATA)) out.insert(out.end(), chunk.data.begin(), chunk.data.end());
    }
    return out;
}

std::vector<uint8_t> to_all_bytes(const std::vector<Chunk>& chunks) {
    std::vector<uint8_t> out;
    for (const auto& chunk : chunks) {
        const auto header = encode_header(chunk.header);
        out.insert(out.end(), header.begin(), header.end());
        out.insert(out.end(), chunk.data.begin(), chunk.data.end());
    }
    return out;
}

std::vector<std::vector<uint8_t>> data_blocks(const std::vector<Chunk>& chunks) {
    std::vector<std::vector<uint8_t>> blocks;
    for (const auto& chunk : chunks) {
        if (chunk.is(TAG_DATA)) blocks.push_back(chunk.data);
    }
    return blocks;
}

std::vector<ChunkInfo> chunk_info(const std::vector<Chunk>& chunks) {
    std::vector<ChunkInfo> info;
    info.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& h = chunks[i].header;
        info.push_back({i, tag_to_string(h.type), classify(h.type), h.length, h.aux});
    }
    return info;
}

} // namespace cas
