#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace cas {

class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Fewer than 8 bytes left where a chunk header should start
class TruncatedHeaderError : public Error
{
public:
    TruncatedHeaderError(size_t chunkIndex, size_t offset, size_t available)
        : Error("Truncated header: chunk " + std::to_string(chunkIndex) + " at offset " +
                std::to_string(offset) + " has only " + std::to_string(available) +
                " of 8 header bytes"),
          chunk_index(chunkIndex), offset(offset), available(available) {}

    size_t chunk_index;
    size_t offset;
    size_t available;
};

// Header declares more payload than the stream holds
class TruncatedPayloadError : public Error
{
public:
    TruncatedPayloadError(size_t chunkIndex, size_t offset, size_t declared, size_t available)
        : Error("Truncated payload: chunk " + std::to_string(chunkIndex) + " at offset " +
                std::to_string(offset) + " declares " + std::to_string(declared) +
                " bytes but only " + std::to_string(available) + " remain (short by " +
                std::to_string(declared - available) + ")"),
          chunk_index(chunkIndex), offset(offset), declared(declared), available(available) {}

    size_t shortfall() const { return declared - available; }

    size_t chunk_index;
    size_t offset;  // offset of the chunk header
    size_t declared;
    size_t available;
};

class SelectionError : public Error
{
public:
    using Error::Error;
};

class InvalidSelectionSyntax : public SelectionError
{
public:
    explicit InvalidSelectionSyntax(const std::string& term)
        : SelectionError("Invalid selection syntax: \"" + term + "\""), term(term) {}

    std::string term;
};

class IndexOutOfRange : public SelectionError
{
public:
    IndexOutOfRange(size_t index, size_t bound)
        : SelectionError("Index out of range: " + std::to_string(index) +
                         (bound == 0 ? std::string(" (image has no chunks)")
                                     : " (valid: 0-" + std::to_string(bound - 1) + ")")),
          index(index), bound(bound) {}

    size_t index;
    size_t bound;  // number of chunks
};

} // namespace cas
