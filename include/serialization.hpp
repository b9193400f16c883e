#pragma once

#include <iosfwd>
#include <string>
#include <nlohmann/json.hpp>
#include "merge_table.hpp"

namespace bpe {
namespace serialization {

constexpr const char* MERGES_FORMAT = "bytepair-merges";
constexpr int MERGES_VERSION = 1;

// {"format": ..., "version": 1, "merges": [[left, right, id], ...]} in priority order.
nlohmann::json merges_to_json(const MergeTable& merges);

// Throws MalformedMergeTableError on a wrong header or bad entries.
MergeTable merges_from_json(const nlohmann::json& j);

void save_merges(const MergeTable& merges, std::ostream& os);
MergeTable load_merges(std::istream& is);

// Throws std::runtime_error if the file cannot be opened.
void save_merges(const MergeTable& merges, const std::string& path);
MergeTable load_merges(const std::string& path);

} // namespace serialization
} // namespace bpe
