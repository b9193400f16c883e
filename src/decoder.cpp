#include "../include/decoder.hpp"

namespace bpe {

std::string decode(const std::vector<SymbolId>& ids, const Vocabulary& vocab) {
    std::string result;
    for (SymbolId id : ids) {
        result += vocab.at(id);
    }
    return result;
}

} // namespace bpe
