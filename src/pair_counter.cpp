#include "../include/pair_counter.hpp"

namespace bpe {

PairCounts count_pairs(const SymbolStream& stream) {
    PairCounts counts;
    if (stream.size() < 2) {
        return counts;
    }
    for (size_t i = 0; i + 1 < stream.size(); ++i) {
        counts[{stream[i], stream[i + 1]}]++;
    }
    return counts;
}

std::optional<PairFrequency> most_frequent_pair(const PairCounts& counts) {
    std::optional<PairFrequency> best;
    for (const auto& [pair, count] : counts) {
        if (!best || count > best->count || (count == best->count && pair < best->pair)) {
            best = PairFrequency{pair, count};
        }
    }
    return best;
}

} // namespace bpe
