#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace bpe {

using SymbolId = uint32_t;
using SymbolStream = std::vector<SymbolId>;
using SymbolPair = std::pair<SymbolId, SymbolId>;

// Ids below this value are literal bytes.
constexpr SymbolId BYTE_VOCAB_SIZE = 256;

/**
 * @brief Converts raw bytes into a symbol stream, one id per byte.
 * @param bytes Raw input, interpreted as unsigned bytes
 * @return Stream of ids in the range [0, 255]
 */
SymbolStream to_symbols(std::string_view bytes);

/**
 * @brief Replaces every non-overlapping occurrence of a pair with a new id.
 *
 * Scans left to right. A match at position i consumes positions i and i+1 and
 * scanning resumes at i+2, so a run "a a a" merged on (a, a) becomes "X a".
 *
 * @param stream Stream rewritten in place
 * @param pair Adjacent pair to replace
 * @param new_id Id written in place of each occurrence
 * @return Number of occurrences replaced
 */
size_t replace_pair(SymbolStream& stream, const SymbolPair& pair, SymbolId new_id);

} // namespace bpe
