#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "logger.hpp"

struct TrainingConfig {
    size_t vocab_size = 512;   // 256 byte tokens plus learned merges
    size_t min_frequency = 2;  // a pair must occur at least this often to be merged

    size_t num_merges() const { return vocab_size > 256 ? vocab_size - 256 : 0; }
};

struct LoggingConfig {
    bool enabled = true;
    LogLevel level = LogLevel::INFO;
    std::string directory;  // empty: stderr only
};

/**
 * @brief Configuration for training and the command-line driver.
 *
 * Defaults are usable as-is. A JSON file may override any subset of keys:
 * @code
 * {
 *   "training": { "vocab_size": 512, "min_frequency": 2 },
 *   "logging":  { "enabled": true, "level": "INFO", "directory": "logs" }
 * }
 * @endcode
 */
struct BpeConfig {
    TrainingConfig training;
    LoggingConfig logging;

    void load_from_json(const std::string& config_path);
    void load_from_json(const nlohmann::json& j);

    // Throws std::invalid_argument on out-of-range values.
    void validate() const;

    // Applies the logging section to the Logger singleton.
    void apply_logging() const;
};

#endif // CONFIG_HPP
