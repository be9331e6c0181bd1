#pragma once
#include <cstddef>
#include <string_view>
#include <vector>

namespace cas {

/**
 * Parse a chunk selection such as "0,2-5,7" into chunk indices.
 *
 * Terms are single indices or inclusive ranges `i-j` with i <= j, separated
 * by commas; whitespace around terms and range bounds is ignored. Indices
 * come out in the order they were asked for, duplicates included.
 *
 * An empty selection is not "all chunks": callers expand that themselves.
 *
 * @throws InvalidSelectionSyntax for an empty, non-numeric or reversed term
 * @throws IndexOutOfRange for an index >= chunkCount
 */
std::vector<size_t> parse_selection(std::string_view selection, size_t chunkCount);

/// Every index [0, chunkCount)
std::vector<size_t> select_all(size_t chunkCount);

} // namespace cas
