#ifndef SIGNALHUB_LOGGER_HPP
#define SIGNALHUB_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>

namespace signalhub {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

class Logger {
public:
    static Logger& getInstance();

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    void setLogFile(const std::string& filename);

    // Messages below this level are discarded.
    void setLevel(LogLevel level);
    LogLevel level() const;
    bool isEnabled(LogLevel level) const;

    /**
     * Parse "debug", "info", "warning"/"warn" or "error" (case-insensitive).
     * Returns false and leaves `out` untouched for anything else.
     */
    static bool parseLevel(const std::string& name, LogLevel& out);

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    std::ofstream log_file_;
    bool file_logging_enabled_ = false;
    LogLevel min_level_ = LogLevel::INFO;

    std::string levelToString(LogLevel level);
    std::string getCurrentTime();
};

} // namespace signalhub

#endif // SIGNALHUB_LOGGER_HPP
