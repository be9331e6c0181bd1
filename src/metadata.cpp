#include "metadata.hpp"
#include <algorithm>

namespace cas {

namespace {
constexpr char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";

const Chunk* find_first(const std::vector<Chunk>& chunks, const Tag& tag) {
    auto it = std::find_if(chunks.begin(), chunks.end(),
                           [&](const Chunk& c) { return c.is(tag); });
    return it == chunks.end() ? nullptr : &*it;
}
} // namespace

std::string decode_utf8_lossy(std::span<const uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        const uint8_t lead = bytes[i];
        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        // Continuation count and the allowed range of the first continuation
        // byte, which excludes overlongs, surrogates and code points > U+10FFFF.
        size_t need = 0;
        uint8_t lo = 0x80, hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF)      need = 1;
        else if (lead == 0xE0)                 { need = 2; lo = 0xA0; }
        else if (lead == 0xED)                 { need = 2; hi = 0x9F; }
        else if (lead >= 0xE1 && lead <= 0xEF) need = 2;
        else if (lead == 0xF0)                 { need = 3; lo = 0x90; }
        else if (lead == 0xF4)                 { need = 3; hi = 0x8F; }
        else if (lead >= 0xF1 && lead <= 0xF3) need = 3;

        if (need == 0) {
            out += REPLACEMENT_CHARACTER;
            ++i;
            continue;
        }

        size_t len = 1;
        while (len <= need && i + len < bytes.size()) {
            const uint8_t c = bytes[i + len];
            if (c < lo || c > hi) break;
            lo = 0x80;
            hi = 0xBF;
            ++len;
        }

        if (len == need + 1) {
            out.append(reinterpret_cast<const char*>(bytes.data() + i), len);
        } else {
            out += REPLACEMENT_CHARACTER;
        }
        i += len;
    }
    return out;
}

Metadata derive_metadata(const std::vector<Chunk>& chunks) {
    Metadata meta;
    meta.chunk_count = chunks.size();
    meta.data_block_count = static_cast<size_t>(
        std::count_if(chunks.begin(), chunks.end(), [](const Chunk& c) { return classify(c.header.type) == ChunkType::DATA; }));

    if (const Chunk* fuji = find_first(chunks, TAG_FUJI)) {
        meta.description = decode_utf8_lossy(fuji->data);
    }

    // Only the first baud chunk counts, even when it is too short to use.
    if (const Chunk* baud = find_first(chunks, TAG_BAUD)) {
        if (baud->data.size() >= 2) {
            meta.baudrate = read_le16(baud->data.data());
        }
    }

    return meta;
}

} // namespace cas
