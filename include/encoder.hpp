#pragma once
#include <string_view>
#include "merge_table.hpp"
#include "symbol_stream.hpp"

namespace bpe {

/**
 * @brief Encodes raw bytes into token ids using a learned merge table.
 *
 * Starts from one id per byte. Each round finds, among all adjacent pairs in
 * the stream, the one with the best (lowest) rank in the table and replaces
 * all its non-overlapping occurrences. Ends when no adjacent pair is in the
 * table. Bytes not covered by any merge pass through as their byte id.
 */
SymbolStream encode(std::string_view text, const MergeTable& merges);

// Runs the same merge loop on an existing stream.
SymbolStream encode_symbols(SymbolStream stream, const MergeTable& merges);

// Bytes per token. Returns 0 when token_count is 0.
double compression_ratio(size_t byte_count, size_t token_count);

} // namespace bpe
