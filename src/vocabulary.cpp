#include "../include/vocabulary.hpp"
#include "../include/bpe_errors.hpp"
#include <algorithm>

namespace bpe {

Vocabulary::Vocabulary() {
    tokens_.reserve(BYTE_VOCAB_SIZE);
    for (SymbolId id = 0; id < BYTE_VOCAB_SIZE; ++id) {
        tokens_.emplace(id, std::string(1, static_cast<char>(id)));
    }
}

const std::string& Vocabulary::at(SymbolId id) const {
    auto it = tokens_.find(id);
    if (it == tokens_.end()) {
        throw UnknownTokenError(id);
    }
    return it->second;
}

std::vector<SymbolId> Vocabulary::ids() const {
    std::vector<SymbolId> result;
    result.reserve(tokens_.size());
    for (const auto& [id, bytes] : tokens_) {
        result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

Vocabulary build_vocabulary(const MergeTable& merges) {
    Vocabulary vocab;
    vocab.tokens_.reserve(BYTE_VOCAB_SIZE + merges.size());

    for (const auto& [pair, id] : merges) {
        auto left = vocab.tokens_.find(pair.first);
        auto right = vocab.tokens_.find(pair.second);
        if (left == vocab.tokens_.end() || right == vocab.tokens_.end()) {
            SymbolId missing = left == vocab.tokens_.end() ? pair.first : pair.second;
            throw MalformedMergeTableError("entry for id " + std::to_string(id) + " references unknown id " +
                                           std::to_string(missing));
        }
        // Build the value before inserting so the iterators above stay valid.
        std::string bytes = left->second + right->second;
        vocab.tokens_.emplace(id, std::move(bytes));
    }
    return vocab;
}

} // namespace bpe
