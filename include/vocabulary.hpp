#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "merge_table.hpp"
#include "symbol_stream.hpp"

namespace bpe {

/**
 * @brief Maps every token id to the raw bytes it expands to.
 *
 * Byte ids 0-255 map to the single byte of that value. A learned id maps to
 * the expansion of its left id followed by the expansion of its right id.
 * Byte sequences are held in std::string and may contain any byte value.
 */
class Vocabulary {
public:
    // Byte-only vocabulary covering ids 0-255.
    Vocabulary();

    // Throws UnknownTokenError if id is not present.
    const std::string& at(SymbolId id) const;
    bool contains(SymbolId id) const { return tokens_.count(id) > 0; }
    size_t size() const { return tokens_.size(); }

    // Ids in ascending order.
    std::vector<SymbolId> ids() const;

private:
    friend Vocabulary build_vocabulary(const MergeTable& merges);

    std::unordered_map<SymbolId, std::string> tokens_;
};

/**
 * @brief Expands a merge table into a vocabulary.
 *
 * Entries are resolved in table order, so every reference must be a byte id
 * or an id introduced by an earlier entry.
 *
 * @throws MalformedMergeTableError if an entry references an unknown id
 */
Vocabulary build_vocabulary(const MergeTable& merges);

} // namespace bpe
