#pragma once
#include "cas.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace cas {

constexpr size_t DUMP_ROW_BYTES = 16;
constexpr size_t DUMP_RULE_WIDTH = 80;
// Width of a full row of hex: "xx " per byte
constexpr size_t DUMP_HEX_COLUMN = DUMP_ROW_BYTES * 3;

struct DumpOptions
{
    bool hex = true;
    bool ascii = false;
};

/**
 * Render the selected chunks as hex and/or ASCII rows.
 *
 * Each chunk gets a header line and a rule, then one row per 16 bytes:
 *
 *   Chunk [1] Type: data, Length: 20, Aux: 250
 *   --------------------------------------------------------------------------------
 *   0000: 55 55 55 55 55 55 55 55 55 55 55 55 55 55 55 55  | UUUUUUUUUUUUUUUU
 *   0010: 7f 7f 7f 00                                      | ....
 *
 * followed by a blank line. Indices may repeat. With neither hex nor ascii
 * only the header and rule are written.
 *
 * @throws IndexOutOfRange if an index does not name a chunk
 */
std::string format_dump(const std::vector<Chunk>& chunks, const std::vector<size_t>& indices,
                        DumpOptions options);

/// One data row: offset, hex column, ascii column
std::string format_dump_row(size_t offset, const uint8_t* bytes, size_t count, DumpOptions options);

/**
 * Default listing: source name, metadata block, one line per chunk and the
 * size of the extracted program image.
 */
std::string format_info(std::string_view sourceName, const std::vector<Chunk>& chunks);

} // namespace cas
