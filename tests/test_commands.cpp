#include <gtest/gtest.h>
#include "../include/commands.hpp"
#include "../include/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

// Owns argv storage for one command invocation.
class CommandLine {
public:
    CommandLine(std::initializer_list<std::string> args) : args_(args) {
        for (auto& arg : args_) {
            argv_.push_back(arg.data());
        }
    }

    CommandLine(const CommandLine&) = delete;
    CommandLine& operator=(const CommandLine&) = delete;

    int argc() const { return static_cast<int>(argv_.size()); }
    char** argv() { return argv_.data(); }

private:
    std::vector<std::string> args_;
    std::vector<char*> argv_;
};

} // namespace

class CommandsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / "bytepair_commands_test";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        corpus = (dir / "corpus.txt").string();
        merges = (dir / "merges.json").string();
        write_file(corpus, "aaabdaaabac aaabdaaabac");
        saved_level = Logger::getInstance().getLogLevel();
    }

    void TearDown() override {
        Logger& logger = Logger::getInstance();
        logger.closeLogFile();
        logger.enableLogging();
        logger.setLogLevel(saved_level);
        std::filesystem::remove_all(dir);
    }

    static void write_file(const std::string& path, const std::string& contents) {
        std::ofstream file(path, std::ios::binary);
        file << contents;
    }

    int run(CommandLine command) {
        out.str("");
        err.str("");
        return cli::run_command(command.argc(), command.argv(), out, err);
    }

    std::filesystem::path dir;
    std::string corpus;
    std::string merges;
    std::stringstream out;
    std::stringstream err;
    LogLevel saved_level = LogLevel::INFO;
};

TEST_F(CommandsTest, TrainRejectsNegativeVocabSize) {
    EXPECT_EQ(run({"bytepair", "train", "--corpus", corpus, "--output", merges, "--vocab-size", "-1"}), 1);
    EXPECT_NE(err.str().find("--vocab-size"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(merges));
}

TEST_F(CommandsTest, TrainRejectsTrailingGarbage) {
    EXPECT_EQ(run({"bytepair", "train", "--corpus", corpus, "--output", merges, "--vocab-size", "300abc"}), 1);
    EXPECT_FALSE(std::filesystem::exists(merges));
}

TEST_F(CommandsTest, TrainRejectsNegativeMinFrequency) {
    EXPECT_EQ(run({"bytepair", "train", "--corpus", corpus, "--output", merges, "--min-frequency", "-1"}), 1);
    EXPECT_NE(err.str().find("--min-frequency"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(merges));
}

TEST_F(CommandsTest, TrainEncodeDecodeRoundTrip) {
    ASSERT_EQ(run({"bytepair", "train", "--corpus", corpus, "--output", merges, "--vocab-size", "259"}), 0);
    EXPECT_TRUE(std::filesystem::exists(merges));

    ASSERT_EQ(run({"bytepair", "encode", "--merges", merges, "--text", "aaabdaaabac"}), 0);
    std::string ids;
    std::getline(out, ids);
    EXPECT_EQ(ids, "258 100 258 97 99");

    ASSERT_EQ(run({"bytepair", "decode", "--merges", merges, "--ids", ids}), 0);
    EXPECT_EQ(out.str(), "aaabdaaabac");
}

TEST_F(CommandsTest, DecodeWritesExactBytes) {
    ASSERT_EQ(run({"bytepair", "train", "--corpus", corpus, "--output", merges, "--vocab-size", "256"}), 0);
    ASSERT_EQ(run({"bytepair", "decode", "--merges", merges, "--ids", "97 32 0 255 10"}), 0);
    EXPECT_EQ(out.str(), std::string("a \0\xff\n", 5));
}

TEST_F(CommandsTest, ErrorsAreReportedWhenLoggingIsDisabled) {
    std::string config = (dir / "quiet.json").string();
    write_file(config, R"({"logging": {"enabled": false}})");

    std::string missing = (dir / "missing.json").string();
    EXPECT_EQ(run({"bytepair", "decode", "--merges", missing, "--ids", "97", "--config", config}), 1);
    EXPECT_NE(err.str().find("[ERROR]"), std::string::npos);
    EXPECT_NE(err.str().find("Could not open merges file"), std::string::npos);
}

TEST_F(CommandsTest, DecodeReportsForeignIds) {
    ASSERT_EQ(run({"bytepair", "train", "--corpus", corpus, "--output", merges, "--vocab-size", "259"}), 0);
    EXPECT_EQ(run({"bytepair", "decode", "--merges", merges, "--ids", "97 300"}), 1);
    EXPECT_NE(err.str().find("Unknown token id: 300"), std::string::npos);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(CommandsTest, UsageErrors) {
    EXPECT_EQ(run({"bytepair"}), 1);
    EXPECT_NE(err.str().find("config/bpe_config.json"), std::string::npos);

    EXPECT_EQ(run({"bytepair", "compress"}), 1);
    EXPECT_NE(err.str().find("Unknown command: compress"), std::string::npos);

    EXPECT_EQ(run({"bytepair", "train", "--corpus", corpus}), 1);
    EXPECT_NE(err.str().find("Usage:"), std::string::npos);
}
