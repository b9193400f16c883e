#include "../include/cli_args.hpp"
#include <sstream>
#include <stdexcept>

namespace cli {

std::string get_arg_value(int argc, char* argv[], const std::string& arg_name) {
    for (int i = 2; i < argc - 1; ++i) {
        if (std::string(argv[i]) == arg_name) {
            return std::string(argv[i + 1]);
        }
    }
    return "";
}

bool arg_exists(int argc, char* argv[], const std::string& arg_name) {
    for (int i = 2; i < argc; ++i) {
        if (std::string(argv[i]) == arg_name) {
            return true;
        }
    }
    return false;
}

size_t parse_size(const std::string& text, const std::string& arg_name) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Expected a non-negative integer for " + arg_name + ", got '" + text + "'");
    }
    try {
        return std::stoul(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Value out of range for " + arg_name + ": " + text);
    }
}

std::vector<unsigned long> parse_id_list(const std::string& text) {
    std::vector<unsigned long> ids;
    std::stringstream ss(text);
    std::string word;
    while (ss >> word) {
        if (word.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("Not a token id: " + word);
        }
        try {
            ids.push_back(std::stoul(word));
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("Token id out of range: " + word);
        }
    }
    return ids;
}

} // namespace cli
