#include "cas.hpp"

namespace cas {

ChunkType classify(const Tag& tag) noexcept {
    if (tag == TAG_FUJI) return ChunkType::FUJI;
    if (tag == TAG_BAUD) return ChunkType::BAUD;
    if (tag == TAG_DATA) return ChunkType::DATA;
    if (tag == TAG_FSK)  return ChunkType::FSK;
    if (tag == TAG_PWMS) return ChunkType::PWMS;
    if (tag == TAG_PWMC) return ChunkType::PWMC;
    if (tag == TAG_PWMD) return ChunkType::PWMD;
    if (tag == TAG_PWML) return ChunkType::PWML;
    return ChunkType::UNKNOWN;
}

std::string_view chunk_type_name(ChunkType type) noexcept {
    switch (type) {
        case ChunkType::FUJI: return "FUJI";
        case ChunkType::BAUD: return "baud";
        case ChunkType::DATA: return "data";
        case ChunkType::FSK:  return "fsk ";
        case ChunkType::PWMS: return "pwms";
        case ChunkType::PWMC: return "pwmc";
        case ChunkType::PWMD: return "pwmd";
        case ChunkType::PWML: return "pwml";
        case ChunkType::UNKNOWN: break;
    }
    return "????";
}

std::array<uint8_t, HEADER_SIZE> encode_header(const ChunkHeader& header) noexcept {
    return {
        header.type[0], header.type[1], header.type[2], header.type[3],
        static_cast<uint8_t>(header.length & 0xFF),
        static_cast<uint8_t>(header.length >> 8),
        static_cast<uint8_t>(header.aux & 0xFF),
        static_cast<uint8_t>(header.aux >> 8),
    };
}

std::string tag_to_string(const Tag& tag) {
    std::string out;
    out.reserve(TAG_SIZE * 2);
    for (uint8_t b : tag) {
        if (b < 0x80) {
            out.push_back(static_cast<char>(b));
        } else {
            // Latin-1 code point U+0080..U+00FF as two UTF-8 bytes
            out.push_back(static_cast<char>(0xC0 | (b >> 6)));
            out.push_back(static_cast<char>(0x80 | (b & 0x3F)));
        }
    }
    return out;
}

} // namespace cas
