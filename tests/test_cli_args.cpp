#include <gtest/gtest.h>
#include "../include/cli_args.hpp"
#include <stdexcept>

TEST(CliArgsTest, ReadsValuesAfterSubcommand) {
    char program[] = "bytepair";
    char command[] = "train";
    char corpus_flag[] = "--corpus";
    char corpus[] = "data.txt";
    char verbose[] = "--verbose";
    char* argv[] = {program, command, corpus_flag, corpus, verbose};
    int argc = 5;

    EXPECT_EQ(cli::get_arg_value(argc, argv, "--corpus"), "data.txt");
    EXPECT_EQ(cli::get_arg_value(argc, argv, "--output"), "");
    // A trailing flag has no value.
    EXPECT_EQ(cli::get_arg_value(argc, argv, "--verbose"), "");
    EXPECT_TRUE(cli::arg_exists(argc, argv, "--verbose"));
    EXPECT_FALSE(cli::arg_exists(argc, argv, "train"));
}

TEST(CliArgsTest, ParsesIdList) {
    EXPECT_EQ(cli::parse_id_list("258 100  258\t97 99"),
              (std::vector<unsigned long>{258, 100, 258, 97, 99}));
    EXPECT_TRUE(cli::parse_id_list("").empty());
    EXPECT_THROW(cli::parse_id_list("1 -2"), std::invalid_argument);
    EXPECT_THROW(cli::parse_id_list("1,2"), std::invalid_argument);
    EXPECT_THROW(cli::parse_id_list("99999999999999999999999"), std::invalid_argument);
}

TEST(CliArgsTest, ParsesSizeStrictly) {
    EXPECT_EQ(cli::parse_size("300", "--vocab-size"), 300u);
    EXPECT_EQ(cli::parse_size("0", "--vocab-size"), 0u);
    EXPECT_THROW(cli::parse_size("-1", "--vocab-size"), std::invalid_argument);
    EXPECT_THROW(cli::parse_size("300abc", "--vocab-size"), std::invalid_argument);
    EXPECT_THROW(cli::parse_size(" 300", "--vocab-size"), std::invalid_argument);
    EXPECT_THROW(cli::parse_size("", "--min-frequency"), std::invalid_argument);
    EXPECT_THROW(cli::parse_size("99999999999999999999999", "--vocab-size"), std::invalid_argument);
}
