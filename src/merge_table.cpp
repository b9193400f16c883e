#include "../include/merge_table.hpp"
#include "../include/bpe_errors.hpp"
#include <string>

namespace bpe {

namespace {

std::string describe(const SymbolPair& pair) {
    return "(" + std::to_string(pair.first) + ", " + std::to_string(pair.second) + ")";
}

} // namespace

void MergeTable::insert(const SymbolPair& pair, SymbolId id) {
    if (index_.count(pair) > 0) {
        throw MalformedMergeTableError("pair " + describe(pair) + " is already present");
    }
    if (id < BYTE_VOCAB_SIZE) {
        throw MalformedMergeTableError("id " + std::to_string(id) + " for pair " + describe(pair) +
                                       " collides with the byte range");
    }
    if (id <= last_id()) {
        throw MalformedMergeTableError("id " + std::to_string(id) + " is not greater than previous id " +
                                       std::to_string(last_id()));
    }

    index_.emplace(pair, entries_.size());
    entries_.push_back({pair, id});
}

std::optional<MergeTable::Rank> MergeTable::rank_of(const SymbolPair& pair) const {
    auto it = index_.find(pair);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<SymbolId> MergeTable::id_of(const SymbolPair& pair) const {
    auto it = index_.find(pair);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return entries_[it->second].id;
}

SymbolId MergeTable::last_id() const {
    return entries_.empty() ? BYTE_VOCAB_SIZE - 1 : entries_.back().id;
}

} // namespace bpe
