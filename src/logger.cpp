#include "../include/logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

LogLevel parse_log_level(const std::string& name) {
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "INFO") return LogLevel::INFO;
    if (name == "WARNING") return LogLevel::WARNING;
    if (name == "ERROR") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: " + name);
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "UNKNOWN";
}

Logger::Logger() : logging_enabled(true), current_level(LogLevel::INFO) {}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::log(const std::string& message) {
    log(message, LogLevel::INFO);
}

void Logger::log(const std::string& message, LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (!logging_enabled || level < current_level) return;

    if (log_file.is_open()) {
        log_file << "[" << log_level_name(level) << "] " << message << std::endl;
    } else {
        std::cerr << "[" << log_level_name(level) << "] " << message << std::endl;
    }
}

bool Logger::isEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(log_mutex);
    return logging_enabled && level >= current_level;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(log_mutex);
    return current_level;
}

void Logger::enableLogging() {
    std::lock_guard<std::mutex> lock(log_mutex);
    logging_enabled = true;
}

void Logger::disableLogging() {
    std::lock_guard<std::mutex> lock(log_mutex);
    logging_enabled = false;
}

void Logger::openLogFile(const std::string& directory) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::stringstream datetime;
    datetime << std::put_time(std::localtime(&time_t_now), "%d%m%Y_%H%M%S");

    std::filesystem::create_directories(directory);
    std::string filename = (std::filesystem::path(directory) / ("bytepair_" + datetime.str() + ".log")).string();

    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_file.open(filename, std::ios::out | std::ios::app);
    if (!log_file.is_open()) {
        throw std::runtime_error("Could not open log file: " + filename);
    }
    log_path = filename;
    log_file << "=== Log started at: " << std::put_time(std::localtime(&time_t_now), "%d-%m-%Y %H:%M:%S")
             << " ===" << std::endl;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path.clear();
}

std::string Logger::getLogPath() const {
    std::lock_guard<std::mutex> lock(log_mutex);
    return log_path;
}

Logger::~Logger() {
    if (log_file.is_open()) {
        log_file.close();
    }
}
