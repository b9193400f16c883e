#include "../include/bpe_tokenizer.hpp"
#include "../include/decoder.hpp"
#include "../include/encoder.hpp"
#include "../include/logger.hpp"
#include "../include/merge_learner.hpp"
#include "../include/serialization.hpp"

namespace bpe {

BytePairTokenizer::BytePairTokenizer(TrainingConfig config)
    : config_(config) {}

BytePairTokenizer::BytePairTokenizer(MergeTable merges, TrainingConfig config)
    : config_(config), merges_(std::move(merges)), vocab_(build_vocabulary(merges_)) {}

void BytePairTokenizer::train(std::string_view corpus) {
    MergeTable learned = learn_merges(corpus, config_);
    Vocabulary vocab = build_vocabulary(learned);

    merges_ = std::move(learned);
    vocab_ = std::move(vocab);
    Logger::getInstance().log("Trained tokenizer on " + std::to_string(corpus.size()) +
                              " bytes, vocabulary size " + std::to_string(vocab_.size()));
}

std::vector<SymbolId> BytePairTokenizer::encode(std::string_view text) const {
    return bpe::encode(text, merges_);
}

std::string BytePairTokenizer::decode(const std::vector<SymbolId>& tokens) const {
    return bpe::decode(tokens, vocab_);
}

void BytePairTokenizer::save(const std::string& path) const {
    serialization::save_merges(merges_, path);
}

void BytePairTokenizer::load(const std::string& path) {
    MergeTable loaded = serialization::load_merges(path);
    Vocabulary vocab = build_vocabulary(loaded);

    merges_ = std::move(loaded);
    vocab_ = std::move(vocab);
}

} // namespace bpe
