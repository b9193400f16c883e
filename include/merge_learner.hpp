#pragma once
#include <string_view>
#include "config.hpp"
#include "merge_table.hpp"
#include "symbol_stream.hpp"

namespace bpe {

// Smallest count a pair needs before it is worth merging.
constexpr size_t DEFAULT_MIN_FREQUENCY = 2;

/**
 * @brief Learns up to num_merges pair merges from a symbol stream.
 *
 * Each step counts adjacent pairs, takes the most frequent one (smallest pair
 * on ties), assigns it the next id starting at 256 and rewrites the stream.
 * Stops early once no pair reaches min_frequency. Empty input or
 * num_merges == 0 give an empty table.
 *
 * @throws std::invalid_argument if min_frequency < 2
 */
MergeTable learn_merges(SymbolStream stream, size_t num_merges,
                        size_t min_frequency = DEFAULT_MIN_FREQUENCY);

MergeTable learn_merges(std::string_view raw_bytes, size_t num_merges,
                        size_t min_frequency = DEFAULT_MIN_FREQUENCY);

// Learns enough merges for a final vocabulary of target_vocab_size ids.
// Throws std::invalid_argument if target_vocab_size < 256.
MergeTable learn_merges_for_vocab_size(std::string_view raw_bytes, size_t target_vocab_size,
                                       size_t min_frequency = DEFAULT_MIN_FREQUENCY);

MergeTable learn_merges(std::string_view raw_bytes, const TrainingConfig& config);

} // namespace bpe
