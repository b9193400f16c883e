#pragma once
#include <optional>
#include <unordered_map>
#include <vector>
#include "symbol_stream.hpp"
#include "utils/hash_utils.hpp"

namespace bpe {

struct MergeEntry {
    SymbolPair pair;
    SymbolId id;

    bool operator==(const MergeEntry& other) const = default;
};

/**
 * @brief Ordered table of learned pair merges.
 *
 * Insertion order is the merge priority: rank 0 was learned first and is
 * applied first by the encoder. Lookups by pair go through a hash index into
 * the ordered entry list.
 *
 * Invariants enforced on insert:
 * - each pair appears at most once
 * - every id is above 255 and strictly greater than the previous id
 */
class MergeTable {
public:
    using Rank = size_t;
    using const_iterator = std::vector<MergeEntry>::const_iterator;

    MergeTable() = default;

    // Throws MalformedMergeTableError when an invariant would be broken.
    void insert(const SymbolPair& pair, SymbolId id);

    std::optional<Rank> rank_of(const SymbolPair& pair) const;
    std::optional<SymbolId> id_of(const SymbolPair& pair) const;
    bool contains(const SymbolPair& pair) const { return index_.count(pair) > 0; }

    const MergeEntry& operator[](Rank rank) const { return entries_[rank]; }
    const std::vector<MergeEntry>& entries() const { return entries_; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Highest id assigned so far, or 255 when the table is empty.
    SymbolId last_id() const;

    const_iterator begin() const { return entries_.cbegin(); }
    const_iterator end() const { return entries_.cend(); }

    bool operator==(const MergeTable& other) const { return entries_ == other.entries_; }

private:
    std::vector<MergeEntry> entries_;
    std::unordered_map<SymbolPair, Rank, pair_hash> index_;
};

} // namespace bpe
