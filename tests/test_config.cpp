#include <gtest/gtest.h>
#include "../include/config.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using nlohmann::json;

TEST(ConfigTest, Defaults) {
    BpeConfig config;
    EXPECT_EQ(config.training.vocab_size, 512u);
    EXPECT_EQ(config.training.min_frequency, 2u);
    EXPECT_EQ(config.training.num_merges(), 256u);
    EXPECT_TRUE(config.logging.enabled);
    EXPECT_EQ(config.logging.level, LogLevel::INFO);
    EXPECT_TRUE(config.logging.directory.empty());
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, OverridesPresentKeysOnly) {
    BpeConfig config;
    json j = {
        {"training", {{"vocab_size", 300}}},
        {"logging", {{"level", "DEBUG"}, {"directory", "out/logs"}}},
    };
    config.load_from_json(j);

    EXPECT_EQ(config.training.vocab_size, 300u);
    EXPECT_EQ(config.training.min_frequency, 2u);
    EXPECT_EQ(config.training.num_merges(), 44u);
    EXPECT_EQ(config.logging.level, LogLevel::DEBUG);
    EXPECT_EQ(config.logging.directory, "out/logs");
    EXPECT_TRUE(config.logging.enabled);
}

TEST(ConfigTest, RejectsInvalidValues) {
    BpeConfig config;
    EXPECT_THROW(config.load_from_json(json{{"training", {{"vocab_size", 100}}}}), std::invalid_argument);

    BpeConfig low_frequency;
    EXPECT_THROW(low_frequency.load_from_json(json{{"training", {{"min_frequency", 1}}}}), std::invalid_argument);

    BpeConfig bad_level;
    EXPECT_THROW(bad_level.load_from_json(json{{"logging", {{"level", "LOUD"}}}}), std::invalid_argument);

    BpeConfig wrong_type;
    EXPECT_THROW(wrong_type.load_from_json(json{{"training", {{"vocab_size", "big"}}}}), std::invalid_argument);
}

TEST(ConfigTest, LoadsFromFile) {
    auto path = (std::filesystem::temp_directory_path() / "bytepair_config_test.json").string();
    {
        std::ofstream file(path);
        file << R"({"training": {"vocab_size": 1024, "min_frequency": 4}, "logging": {"enabled": false}})";
    }

    BpeConfig config;
    config.load_from_json(path);
    std::filesystem::remove(path);

    EXPECT_EQ(config.training.vocab_size, 1024u);
    EXPECT_EQ(config.training.min_frequency, 4u);
    EXPECT_FALSE(config.logging.enabled);
}

TEST(ConfigTest, MissingOrBrokenFileThrows) {
    BpeConfig config;
    EXPECT_THROW(config.load_from_json(std::string("/nonexistent/bytepair.json")), std::runtime_error);

    auto path = (std::filesystem::temp_directory_path() / "bytepair_broken_config.json").string();
    {
        std::ofstream file(path);
        file << "{ not json";
    }
    EXPECT_THROW(config.load_from_json(path), std::runtime_error);
    std::filesystem::remove(path);
}
