#include "../include/serialization.hpp"
#include "../include/bpe_errors.hpp"
#include "../include/logger.hpp"
#include <fstream>
#include <limits>
#include <stdexcept>

namespace bpe {
namespace serialization {

namespace {

SymbolId read_id(const nlohmann::json& value, size_t entry_index) {
    if (!value.is_number_unsigned() ||
        value.get<uint64_t>() > std::numeric_limits<SymbolId>::max()) {
        throw MalformedMergeTableError("entry " + std::to_string(entry_index) +
                                       " holds a value that is not a valid token id");
    }
    return static_cast<SymbolId>(value.get<uint64_t>());
}

} // namespace

nlohmann::json merges_to_json(const MergeTable& merges) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& [pair, id] : merges) {
        entries.push_back({pair.first, pair.second, id});
    }

    nlohmann::json j;
    j["format"] = MERGES_FORMAT;
    j["version"] = MERGES_VERSION;
    j["merges"] = std::move(entries);
    return j;
}

MergeTable merges_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw MalformedMergeTableError("document is not a JSON object");
    }
    if (!j.contains("format") || !j["format"].is_string() || j["format"].get<std::string>() != MERGES_FORMAT) {
        throw MalformedMergeTableError("missing or unexpected format tag");
    }
    if (!j.contains("version") || !j["version"].is_number_integer() ||
        j["version"].get<int>() != MERGES_VERSION) {
        throw MalformedMergeTableError("unsupported version");
    }
    if (!j.contains("merges") || !j["merges"].is_array()) {
        throw MalformedMergeTableError("missing merges array");
    }

    MergeTable merges;
    const auto& entries = j["merges"];
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        if (!entry.is_array() || entry.size() != 3) {
            throw MalformedMergeTableError("entry " + std::to_string(i) + " is not a [left, right, id] triple");
        }
        merges.insert({read_id(entry[0], i), read_id(entry[1], i)}, read_id(entry[2], i));
    }
    return merges;
}

void save_merges(const MergeTable& merges, std::ostream& os) {
    os << merges_to_json(merges).dump(2);
}

MergeTable load_merges(std::istream& is) {
    nlohmann::json j;
    try {
        is >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedMergeTableError(std::string("invalid JSON: ") + e.what());
    }
    return merges_from_json(j);
}

void save_merges(const MergeTable& merges, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open merges file for writing: " + path);
    }
    save_merges(merges, file);
    if (!file) {
        throw std::runtime_error("Failed to write merges file: " + path);
    }
    Logger::getInstance().log("Saved " + std::to_string(merges.size()) + " merges to " + path, LogLevel::DEBUG);
}

MergeTable load_merges(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open merges file: " + path);
    }
    MergeTable merges = load_merges(file);
    Logger::getInstance().log("Loaded " + std::to_string(merges.size()) + " merges from " + path, LogLevel::DEBUG);
    return merges;
}

} // namespace serialization
} // namespace bpe
