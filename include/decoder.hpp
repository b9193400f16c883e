#pragma once
#include <string>
#include <vector>
#include "symbol_stream.hpp"
#include "vocabulary.hpp"

namespace bpe {

// Concatenates the byte expansion of each id. Throws UnknownTokenError for an
// id missing from vocab, which means the ids came from a different table.
std::string decode(const std::vector<SymbolId>& ids, const Vocabulary& vocab);

} // namespace bpe
