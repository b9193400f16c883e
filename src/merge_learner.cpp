#include "../include/merge_learner.hpp"
#include "../include/logger.hpp"
#include "../include/pair_counter.hpp"
#include <sstream>
#include <stdexcept>

namespace bpe {

MergeTable learn_merges(SymbolStream stream, size_t num_merges, size_t min_frequency) {
    if (min_frequency < DEFAULT_MIN_FREQUENCY) {
        throw std::invalid_argument("min_frequency must be at least 2, got " + std::to_string(min_frequency));
    }

    MergeTable merges;
    if (num_merges == 0) {
        return merges;
    }

    Logger& logger = Logger::getInstance();
    const size_t initial_length = stream.size();

    for (size_t i = 0; i < num_merges; ++i) {
        auto best = most_frequent_pair(count_pairs(stream));
        if (!best || best->count < min_frequency) {
            break;
        }

        const SymbolId new_id = BYTE_VOCAB_SIZE + static_cast<SymbolId>(i);
        size_t replaced = replace_pair(stream, best->pair, new_id);
        merges.insert(best->pair, new_id);

        if (logger.isEnabled(LogLevel::DEBUG)) {
            std::stringstream ss;
            ss << "merging (" << best->pair.first << ", " << best->pair.second << ") into a new token "
               << new_id << ", " << replaced << " occurrences";
            logger.log(ss.str(), LogLevel::DEBUG);
        }
    }

    std::stringstream summary;
    summary << "Learned " << merges.size() << " of " << num_merges << " requested merges, stream length "
            << initial_length << " -> " << stream.size();
    logger.log(summary.str(), LogLevel::INFO);

    return merges;
}

MergeTable learn_merges(std::string_view raw_bytes, size_t num_merges, size_t min_frequency) {
    return learn_merges(to_symbols(raw_bytes), num_merges, min_frequency);
}

MergeTable learn_merges_for_vocab_size(std::string_view raw_bytes, size_t target_vocab_size,
                                       size_t min_frequency) {
    if (target_vocab_size < BYTE_VOCAB_SIZE) {
        throw std::invalid_argument("Target vocabulary size must be at least 256, got " +
                                    std::to_string(target_vocab_size));
    }
    return learn_merges(raw_bytes, target_vocab_size - BYTE_VOCAB_SIZE, min_frequency);
}

MergeTable learn_merges(std::string_view raw_bytes, const TrainingConfig& config) {
    return learn_merges_for_vocab_size(raw_bytes, config.vocab_size, config.min_frequency);
}

} // namespace bpe
