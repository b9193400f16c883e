#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace cli {

// Value following "--key", or an empty string if absent. Scans from argv[2] on,
// after the program name and subcommand.
std::string get_arg_value(int argc, char* argv[], const std::string& arg_name);

bool arg_exists(int argc, char* argv[], const std::string& arg_name);

// Parses a single non-negative decimal integer, digits only.
// Throws std::invalid_argument on a sign, trailing characters or overflow.
size_t parse_size(const std::string& text, const std::string& arg_name);

// Parses a whitespace separated list of non-negative integers.
// Throws std::invalid_argument on any other token.
std::vector<unsigned long> parse_id_list(const std::string& text);

} // namespace cli
