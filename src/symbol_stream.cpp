#include "../include/symbol_stream.hpp"

namespace bpe {

SymbolStream to_symbols(std::string_view bytes) {
    SymbolStream symbols;
    symbols.reserve(bytes.size());
    for (char c : bytes) {
        symbols.push_back(static_cast<unsigned char>(c));
    }
    return symbols;
}

size_t replace_pair(SymbolStream& stream, const SymbolPair& pair, SymbolId new_id) {
    if (stream.size() < 2) {
        return 0;
    }

    SymbolStream merged;
    merged.reserve(stream.size());
    size_t replaced = 0;

    for (size_t i = 0; i < stream.size();) {
        if (i + 1 < stream.size() && stream[i] == pair.first && stream[i + 1] == pair.second) {
            merged.push_back(new_id);
            ++replaced;
            i += 2;
        } else {
            merged.push_back(stream[i]);
            i += 1;
        }
    }

    if (replaced > 0) {
        stream = std::move(merged);
    }
    return replaced;
}

} // namespace bpe
