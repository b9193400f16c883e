#pragma once
#include <fstream>
#include <mutex>
#include <string>

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

// Parses "DEBUG", "INFO", "WARNING" or "ERROR". Throws std::invalid_argument otherwise.
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

class Logger {
private:
    std::ofstream log_file;
    std::string log_path;
    bool logging_enabled;
    LogLevel current_level;
    mutable std::mutex log_mutex;

    Logger();  // Private constructor for singleton

public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& getInstance();

    void log(const std::string& message);
    void log(const std::string& message, LogLevel level);
    bool isEnabled(LogLevel level) const;

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void enableLogging();
    void disableLogging();

    // Opens <directory>/bytepair_<timestamp>.log. Messages go to stderr until then.
    void openLogFile(const std::string& directory);
    void closeLogFile();
    std::string getLogPath() const;

    ~Logger();
};
