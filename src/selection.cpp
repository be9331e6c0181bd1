#include "selection.hpp"
#include "errors.hpp"
#include <cctype>
#include <charconv>
#include <numeric>
#include <string>
#include <system_error>

namespace cas {

namespace {

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
}

// Plain decimal only: no sign, no prefix. `term` is reported on failure.
size_t parse_index(std::string_view digits, std::string_view term) {
    digits = trim(digits);
    if (digits.empty() || !std::isdigit(static_cast<unsigned char>(digits.front())))
        throw InvalidSelectionSyntax(std::string(term));

    size_t value = 0;
    const char* end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), end, value);
    if (ec != std::errc() || ptr != end)
        throw InvalidSelectionSyntax(std::string(term));
    return value;
}

void check_bound(size_t index, size_t chunkCount) {
    if (index >= chunkCount) throw IndexOutOfRange(index, chunkCount);
}

} // namespace

std::vector<size_t> parse_selection(std::string_view selection, size_t chunkCount) {
    std::vector<size_t> indices;

    size_t start = 0;
    while (true) {
        const size_t comma = selection.find(',', start);
        const std::string_view term =
            trim(selection.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start));

        if (term.empty()) throw InvalidSelectionSyntax(std::string(term));

        const size_t dash = term.find('-');
        if (dash == std::string_view::npos) {
            const size_t index = parse_index(term, term);
            check_bound(index, chunkCount);
            indices.push_back(index);
        } else {
            const size_t first = parse_index(term.substr(0, dash), term);
            const size_t last = parse_index(term.substr(dash + 1), term);
            if (first > last) throw InvalidSelectionSyntax(std::string(term));
            check_bound(first, chunkCount);
            check_bound(last, chunkCount);
            for (size_t i = first; i <= last; ++i) indices.push_back(i);
        }

        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }

    return indices;
}

std::vector<size_t> select_all(size_t chunkCount) {
    std::vector<size_t> indices(chunkCount);
    std::iota(indices.begin(), indices.end(), size_t{0});
    return indices;
}

} // namespace cas
