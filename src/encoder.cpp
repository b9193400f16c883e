#include "../include/encoder.hpp"
#include <optional>

namespace bpe {

namespace {

// Best-ranked table pair present anywhere in the stream.
std::optional<MergeTable::Rank> lowest_rank_candidate(const SymbolStream& stream, const MergeTable& merges) {
    std::optional<MergeTable::Rank> best;
    for (size_t i = 0; i + 1 < stream.size(); ++i) {
        auto rank = merges.rank_of({stream[i], stream[i + 1]});
        if (rank && (!best || *rank < *best)) {
            best = rank;
            if (*best == 0) {
                break;
            }
        }
    }
    return best;
}

} // namespace

SymbolStream encode_symbols(SymbolStream stream, const MergeTable& merges) {
    if (merges.empty()) {
        return stream;
    }

    while (stream.size() > 1) {
        auto rank = lowest_rank_candidate(stream, merges);
        if (!rank) {
            break;
        }
        const MergeEntry& entry = merges[*rank];
        replace_pair(stream, entry.pair, entry.id);
    }
    return stream;
}

SymbolStream encode(std::string_view text, const MergeTable& merges) {
    return encode_symbols(to_symbols(text), merges);
}

double compression_ratio(size_t byte_count, size_t token_count) {
    if (token_count == 0) {
        return 0.0;
    }
    return static_cast<double>(byte_count) / static_cast<double>(token_count);
}

} // namespace bpe
