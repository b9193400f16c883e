#pragma once
#include <stdexcept>
#include <string>
#include "symbol_stream.hpp"

namespace bpe {

// Raised when a merge table violates its ordering or reference invariants.
class MalformedMergeTableError : public std::runtime_error {
public:
    explicit MalformedMergeTableError(const std::string& message)
        : std::runtime_error("Malformed merge table: " + message) {}
};

// Raised when an id has no entry in the vocabulary.
class UnknownTokenError : public std::out_of_range {
public:
    explicit UnknownTokenError(SymbolId id)
        : std::out_of_range("Unknown token id: " + std::to_string(id)), token_id_(id) {}

    SymbolId token_id() const { return token_id_; }

private:
    SymbolId token_id_;
};

} // namespace bpe
