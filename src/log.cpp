#include "hxfer/log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace hxfer {

LogLevel parse_log_level(const std::string& name) {
    std::string n(name);
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (n == "debug") return LogLevel::Debug;
    if (n == "info") return LogLevel::Info;
    if (n == "warning" || n == "warn") return LogLevel::Warning;
    if (n == "error") return LogLevel::Error;
    throw std::invalid_argument("unknown log level: " + name);
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger(LogLevel level, const std::string& logFile) : level_(level) {
    if (!logFile.empty()) setLogFile(logFile);
}

Logger::~Logger() {
    if (file_.is_open()) file_.close();
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::setLogFile(const std::string& logFile) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) file_.close();
    if (logFile.empty()) return;
    file_.open(logFile, std::ios::app);
    if (!file_) throw std::runtime_error("open log file failed: " + logFile);
}

void Logger::setConsole(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enabled;
}

void Logger::write(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << '[' << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    switch (level) {
        case LogLevel::Debug:   oss << "[DEBUG] "; break;
        case LogLevel::Info:    oss << "[INFO] "; break;
        case LogLevel::Warning: oss << "[WARNING] "; break;
        case LogLevel::Error:   oss << "[ERROR] "; break;
    }
    oss << message << '\n';
    const std::string line = oss.str();

    std::lock_guard<std::mutex> lock(mutex_);
    if (console_) std::cerr << line;
    if (file_.is_open()) {
        file_ << line;
        file_.flush();
    }
}

} // namespace hxfer
