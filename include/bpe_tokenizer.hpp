#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "config.hpp"
#include "merge_table.hpp"
#include "vocabulary.hpp"

namespace bpe {

class BytePairTokenizer {
public:
    explicit BytePairTokenizer(TrainingConfig config = {});

    // Builds from an existing table. Throws MalformedMergeTableError on bad references.
    explicit BytePairTokenizer(MergeTable merges, TrainingConfig config = {});

    // Training methods
    void train(std::string_view corpus);

    // Tokenization methods
    std::vector<SymbolId> encode(std::string_view text) const;
    std::string decode(const std::vector<SymbolId>& tokens) const;

    // Vocabulary methods
    size_t vocab_size() const { return vocab_.size(); }
    const MergeTable& merges() const { return merges_; }
    const Vocabulary& vocabulary() const { return vocab_; }
    const TrainingConfig& config() const { return config_; }

    void save(const std::string& path) const;
    void load(const std::string& path);

private:
    TrainingConfig config_;
    MergeTable merges_;
    Vocabulary vocab_;
};

} // namespace bpe
