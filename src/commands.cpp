#include "../include/commands.hpp"
#include "../include/bpe_errors.hpp"
#include "../include/bpe_tokenizer.hpp"
#include "../include/cli_args.hpp"
#include "../include/config.hpp"
#include "../include/encoder.hpp"
#include "../include/logger.hpp"
#include <fstream>
#include <functional>
#include <limits>
#include <map>
#include <ostream>
#include <sstream>
#include <string>

namespace cli {

namespace {

void print_usage(std::ostream& err) {
    err << "Usage: ./bytepair <command> [options]" << std::endl;
    err << "Commands:" << std::endl;
    err << "  train  --corpus <path> --output <merges.json> [--vocab-size N] [--min-frequency F] [--config <json>]"
        << std::endl;
    err << "  encode --merges <merges.json> (--text <string> | --input <path>)" << std::endl;
    err << "  decode --merges <merges.json> --ids \"<id> <id> ...\"" << std::endl;
    err << "Options for every command: [--config <json>] [--verbose]" << std::endl;
    err << "  see config/bpe_config.json for the config file layout" << std::endl;
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

BpeConfig load_config(int argc, char* argv[]) {
    BpeConfig config;
    std::string config_path = get_arg_value(argc, argv, "--config");
    if (!config_path.empty()) {
        config.load_from_json(config_path);
    }

    if (arg_exists(argc, argv, "--vocab-size")) {
        config.training.vocab_size = parse_size(get_arg_value(argc, argv, "--vocab-size"), "--vocab-size");
    }
    if (arg_exists(argc, argv, "--min-frequency")) {
        config.training.min_frequency = parse_size(get_arg_value(argc, argv, "--min-frequency"), "--min-frequency");
    }
    if (arg_exists(argc, argv, "--verbose")) {
        config.logging.level = LogLevel::DEBUG;
    }

    config.validate();
    config.apply_logging();
    return config;
}

} // namespace

int handle_train(int argc, char* argv[], std::ostream& out, std::ostream& err) {
    std::string corpus_path = get_arg_value(argc, argv, "--corpus");
    std::string output_path = get_arg_value(argc, argv, "--output");
    if (corpus_path.empty() || output_path.empty()) {
        print_usage(err);
        return 1;
    }

    BpeConfig config = load_config(argc, argv);
    Logger::getInstance().log("Training tokenizer on " + corpus_path + " with target vocabulary size " +
                              std::to_string(config.training.vocab_size));

    bpe::BytePairTokenizer tokenizer(config.training);
    tokenizer.train(read_file(corpus_path));
    tokenizer.save(output_path);

    out << "Learned " << tokenizer.merges().size() << " merges, saved to " << output_path << std::endl;
    return 0;
}

int handle_encode(int argc, char* argv[], std::ostream& out, std::ostream& err) {
    std::string merges_path = get_arg_value(argc, argv, "--merges");
    std::string text = get_arg_value(argc, argv, "--text");
    std::string input_path = get_arg_value(argc, argv, "--input");
    if (merges_path.empty() || (text.empty() == input_path.empty())) {
        print_usage(err);
        return 1;
    }

    load_config(argc, argv);
    if (!input_path.empty()) {
        text = read_file(input_path);
    }

    bpe::BytePairTokenizer tokenizer;
    tokenizer.load(merges_path);
    auto ids = tokenizer.encode(text);

    for (size_t i = 0; i < ids.size(); ++i) {
        out << (i == 0 ? "" : " ") << ids[i];
    }
    out << std::endl;
    out << "Compression: " << bpe::compression_ratio(text.size(), ids.size()) << std::endl;
    return 0;
}

int handle_decode(int argc, char* argv[], std::ostream& out, std::ostream& err) {
    std::string merges_path = get_arg_value(argc, argv, "--merges");
    if (merges_path.empty() || !arg_exists(argc, argv, "--ids")) {
        print_usage(err);
        return 1;
    }

    load_config(argc, argv);
    std::vector<bpe::SymbolId> ids;
    for (unsigned long id : parse_id_list(get_arg_value(argc, argv, "--ids"))) {
        if (id > std::numeric_limits<bpe::SymbolId>::max()) {
            throw std::invalid_argument("Token id out of range: " + std::to_string(id));
        }
        ids.push_back(static_cast<bpe::SymbolId>(id));
    }

    bpe::BytePairTokenizer tokenizer;
    tokenizer.load(merges_path);

    // Raw bytes, no trailing newline.
    std::string bytes = tokenizer.decode(ids);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    return 0;
}

int run_command(int argc, char* argv[], std::ostream& out, std::ostream& err) {
    if (argc < 2) {
        print_usage(err);
        return 1;
    }

    using CommandHandler = std::function<int(int, char*[], std::ostream&, std::ostream&)>;
    std::map<std::string, CommandHandler> commands;
    commands["train"] = handle_train;
    commands["encode"] = handle_encode;
    commands["decode"] = handle_decode;

    std::string command = argv[1];
    auto it = commands.find(command);
    if (it == commands.end()) {
        err << "Unknown command: " << command << std::endl;
        print_usage(err);
        return 1;
    }

    std::string message;
    try {
        return it->second(argc, argv, out, err);
    } catch (const bpe::MalformedMergeTableError& e) {
        message = e.what();
    } catch (const bpe::UnknownTokenError& e) {
        message = std::string(e.what()) + " (ids do not match this merge table)";
    } catch (const std::exception& e) {
        message = std::string("Error: ") + e.what();
    }

    // Reported on err even when logging is disabled by the config.
    err << "[ERROR] " << message << std::endl;
    Logger& logger = Logger::getInstance();
    if (!logger.getLogPath().empty()) {
        logger.log(message, LogLevel::ERROR);
    }
    return 1;
}

} // namespace cli
