/**
 * @file cas.hpp
 * @brief Data layout of the Atari 8-bit cassette image (CAS) container
 *
 * A CAS image is a flat sequence of self-describing chunks:
 *
 *   +------+--------+-----+-----------------+
 *   | tag  | length | aux | payload         |
 *   | 4 B  | u16 LE | u16 | `length` bytes  |
 *   +------+--------+-----+-----------------+
 *
 * Chunks are back-to-back with no padding. There is no global header, no
 * footer, no chunk count and no checksum; end of stream terminates the image.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cas {

// =============================================================================
// BYTE ORDER: ALL MULTI-BYTE VALUES ARE LITTLE-ENDIAN
// Example: The value 0x0258 (600) is stored as bytes [0x58, 0x02]
// =============================================================================

/// Size of every chunk header on disk
constexpr size_t HEADER_SIZE = 8;

/// Size of the type tag at the start of a header
constexpr size_t TAG_SIZE = 4;

/// Baudrate assumed when the image carries no usable `baud` chunk
constexpr uint16_t DEFAULT_BAUDRATE = 600;

/// Raw 4-byte chunk type, conventionally ASCII but not required to be
using Tag = std::array<uint8_t, TAG_SIZE>;

/**
 * @brief Build a tag from a 4 character literal, e.g. make_tag("fsk ")
 */
constexpr Tag make_tag(const char (&s)[TAG_SIZE + 1]) noexcept {
    return Tag{static_cast<uint8_t>(s[0]), static_cast<uint8_t>(s[1]),
               static_cast<uint8_t>(s[2]), static_cast<uint8_t>(s[3])};
}

// =============================================================================
// KNOWN CHUNK TAGS
// Unknown tags are legal: the container is extensible.
// =============================================================================

constexpr Tag TAG_FUJI = make_tag("FUJI");  ///< UTF-8 tape description
constexpr Tag TAG_BAUD = make_tag("baud");  ///< u16 LE transmission baudrate
constexpr Tag TAG_DATA = make_tag("data");  ///< Standard SIO record
constexpr Tag TAG_FSK  = make_tag("fsk ");  ///< Non-standard FSK signal lengths
constexpr Tag TAG_PWMS = make_tag("pwms");  ///< Turbo transmission settings
constexpr Tag TAG_PWMC = make_tag("pwmc");  ///< Turbo synchronization signal
constexpr Tag TAG_PWMD = make_tag("pwmd");  ///< Turbo data block
constexpr Tag TAG_PWML = make_tag("pwml");  ///< Raw PWM state sequence

enum class ChunkType
{
    FUJI,
    BAUD,
    DATA,
    FSK,
    PWMS,
    PWMC,
    PWMD,
    PWML,
    UNKNOWN,
};

/**
 * @brief Map a raw tag onto the known chunk types
 * @return ChunkType::UNKNOWN for any tag not listed above
 */
ChunkType classify(const Tag& tag) noexcept;

/// Canonical 4 character spelling of a known type, "????" for UNKNOWN
std::string_view chunk_type_name(ChunkType type) noexcept;

/**
 * @brief Fixed 8-byte record preceding every payload
 *
 * `length` is authoritative: the payload is exactly `length` bytes.
 * `aux` is type dependent (e.g. the gap length for `data` and `fsk `).
 */
struct ChunkHeader {
    Tag type{};
    uint16_t length = 0;
    uint16_t aux = 0;
};

struct Chunk {
    ChunkHeader header;
    std::vector<uint8_t> data;  // data.size() == header.length

    bool is(const Tag& tag) const noexcept { return header.type == tag; }
};

constexpr uint16_t read_le16(const uint8_t* p) noexcept {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline void append_le16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>(value >> 8));
}

/// Wire form of a header: tag, length, aux
std::array<uint8_t, HEADER_SIZE> encode_header(const ChunkHeader& header) noexcept;

/**
 * @brief Render a tag for display
 *
 * Bytes are taken as Latin-1 and transcoded to UTF-8, so printable ASCII
 * tags come out unchanged and corrupt tags stay visible without producing
 * invalid output.
 */
std::string tag_to_string(const Tag& tag);

} // namespace cas
