#pragma once
#include <optional>
#include <unordered_map>
#include "symbol_stream.hpp"
#include "utils/hash_utils.hpp"

namespace bpe {

using PairCounts = std::unordered_map<SymbolPair, size_t, pair_hash>;

struct PairFrequency {
    SymbolPair pair;
    size_t count;
};

// Counts every adjacent pair, overlapping positions included.
PairCounts count_pairs(const SymbolStream& stream);

/**
 * @brief Picks the pair with the highest count.
 *
 * Ties are broken by the numerically smallest (left, right) pair so the result
 * does not depend on hash map iteration order.
 *
 * @return The winning pair, or std::nullopt when counts is empty
 */
std::optional<PairFrequency> most_frequent_pair(const PairCounts& counts);

} // namespace bpe
