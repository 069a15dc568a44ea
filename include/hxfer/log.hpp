#pragma once
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace hxfer {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

LogLevel parse_log_level(const std::string& name);

// Thread-safe line logger: stderr plus an optional append-only file.
// Messages use "{}" placeholders.
class Logger {
public:
    static Logger& instance();

    explicit Logger(LogLevel level = LogLevel::Info, const std::string& logFile = "");
    ~Logger();

    void setLevel(LogLevel level);
    LogLevel level() const;
    void setLogFile(const std::string& logFile);
    void setConsole(bool enabled);

    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        log(LogLevel::Debug, format, std::forward<Args>(args)...);
    }
    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        log(LogLevel::Info, format, std::forward<Args>(args)...);
    }
    template<typename... Args>
    void warning(const std::string& format, Args&&... args) {
        log(LogLevel::Warning, format, std::forward<Args>(args)...);
    }
    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        log(LogLevel::Error, format, std::forward<Args>(args)...);
    }

private:
    template<typename... Args>
    void log(LogLevel level, const std::string& format, Args&&... args) {
        if (level < this->level()) return;
        std::ostringstream oss;
        formatHelper(oss, format, std::forward<Args>(args)...);
        write(level, oss.str());
    }

    void write(LogLevel level, const std::string& message);

    static void formatHelper(std::ostringstream& oss, const std::string& format) {
        oss << format;
    }

    template<typename T, typename... Args>
    static void formatHelper(std::ostringstream& oss, const std::string& format, T&& t, Args&&... args) {
        size_t pos = format.find("{}");
        if (pos == std::string::npos) {
            oss << format;
            return;
        }
        oss << format.substr(0, pos) << t;
        formatHelper(oss, format.substr(pos + 2), std::forward<Args>(args)...);
    }

    LogLevel level_;
    bool console_ = true;
    std::ofstream file_;
    mutable std::mutex mutex_;
};

} // namespace hxfer
