#include "dump.hpp"
#include "errors.hpp"
#include "metadata.hpp"
#include "payload.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace cas {

std::string format_dump_row(size_t offset, const uint8_t* bytes, size_t count, DumpOptions options) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(4) << offset << ":";

    if (options.hex) {
        std::ostringstream hex;
        hex << std::hex << std::setfill('0');
        for (size_t i = 0; i < count; ++i) {
            if (i > 0) hex << ' ';
            hex << std::setw(2) << static_cast<int>(bytes[i]);
        }
        std::string column = hex.str();
        // Pad short rows so the ascii column lines up with full ones
        if (options.ascii) column.resize(DUMP_HEX_COLUMN, ' ');
        oss << ' ' << column;
    }

    if (options.ascii) {
        oss << (options.hex ? " | " : " ");
        for (size_t i = 0; i < count; ++i) {
            const uint8_t b = bytes[i];
            oss << (b >= 0x20 && b <= 0x7E ? static_cast<char>(b) : '.');
        }
    }

    return oss.str();
}

std::string format_dump(const std::vector<Chunk>& chunks, const std::vector<size_t>& indices,
                        DumpOptions options) {
    std::ostringstream out;

    for (size_t index : indices) {
        if (index >= chunks.size()) throw IndexOutOfRange(index, chunks.size());
        const Chunk& chunk = chunks[index];

        out << "Chunk [" << index << "] Type: " << tag_to_string(chunk.header.type)
            << ", Length: " << chunk.header.length << ", Aux: " << chunk.header.aux << '\n';
        out << std::string(DUMP_RULE_WIDTH, '-') << '\n';

        if (options.hex || options.ascii) {
            for (size_t offset = 0; offset < chunk.data.size(); offset += DUMP_ROW_BYTES) {
                const size_t count = std::min(DUMP_ROW_BYTES, chunk.data.size() - offset);
                out << format_dump_row(offset, chunk.data.data() + offset, count, options) << '\n';
            }
        }

        out << '\n';
    }

    return out.str();
}

std::string format_info(std::string_view sourceName, const std::vector<Chunk>& chunks) {
    const Metadata meta = derive_metadata(chunks);
    std::ostringstream out;

    out << "CAS File: " << sourceName << "\n\n";
    out << "Metadata:\n";
    out << "  description: " << meta.description.value_or("(none)") << '\n';
    out << "  baudrate: " << meta.baudrate << '\n';
    out << "  chunk_count: " << meta.chunk_count << '\n';
    out << "  data_block_count: " << meta.data_block_count << '\n';

    out << "\nChunks:\n";
    for (const auto& info : chunk_info(chunks)) {
        out << "  [" << info.index << "] " << info.type << ": " << info.length
            << " bytes (aux: " << info.aux << ")\n";
    }

    out << "\nTotal data bytes: " << to_byte_array(chunks).size() << '\n';
    return out.str();
}

} // namespace cas
