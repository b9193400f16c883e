#include "../include/config.hpp"
#include <fstream>
#include <stdexcept>

void BpeConfig::load_from_json(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open config file: " + config_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Could not parse config file " + config_path + ": " + e.what());
    }
    load_from_json(j);
    Logger::getInstance().log("Loaded configuration from: " + config_path, LogLevel::DEBUG);
}

void BpeConfig::load_from_json(const nlohmann::json& j) {
    try {
        if (j.contains("training")) {
            const auto& training_json = j["training"];
            training.vocab_size = training_json.value("vocab_size", training.vocab_size);
            training.min_frequency = training_json.value("min_frequency", training.min_frequency);
        }

        if (j.contains("logging")) {
            const auto& logging_json = j["logging"];
            logging.enabled = logging_json.value("enabled", logging.enabled);
            logging.directory = logging_json.value("directory", logging.directory);
            if (logging_json.contains("level")) {
                logging.level = parse_log_level(logging_json["level"].get<std::string>());
            }
        }
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::string("Invalid configuration value: ") + e.what());
    }

    validate();
}

void BpeConfig::validate() const {
    if (training.vocab_size < 256) {
        throw std::invalid_argument("vocab_size must be at least 256, got " +
                                    std::to_string(training.vocab_size));
    }
    if (training.min_frequency < 2) {
        throw std::invalid_argument("min_frequency must be at least 2, got " +
                                    std::to_string(training.min_frequency));
    }
}

void BpeConfig::apply_logging() const {
    Logger& logger = Logger::getInstance();
    logger.setLogLevel(logging.level);
    if (logging.enabled) {
        logger.enableLogging();
    } else {
        logger.disableLogging();
    }
    if (!logging.directory.empty()) {
        logger.openLogFile(logging.directory);
    }
}
