#ifndef PARABOX_CORE_LOGGER_HPP
#define PARABOX_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <atomic>
#include <mutex>

namespace parabox {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Process-wide stderr logger. The supervisor and every plugin host share the
// terminal, so each line carries a process tag and pid.
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Accepts "debug", "info", "warn", "error"; anything else leaves the level unchanged
    bool set_level(const std::string& name);

    // Process tag printed in every line ("supervisor", "host", ...)
    void set_tag(const std::string& tag);

    bool enabled(LogLevel level) const {
        return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    void log(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    std::atomic<int> level_;
    std::string tag_;
    std::mutex mutex_;
};

const char* log_level_name(LogLevel level);

// Convenience macros; arguments are not evaluated below the active level
#define PARABOX_LOG(lvl, ...) \
    do { \
        if (parabox::Logger::instance().enabled(lvl)) \
            parabox::Logger::instance().log(lvl, __VA_ARGS__); \
    } while (0)

#define LOG_DEBUG(...) PARABOX_LOG(parabox::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  PARABOX_LOG(parabox::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  PARABOX_LOG(parabox::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) PARABOX_LOG(parabox::LogLevel::ERROR, __VA_ARGS__)

} // namespace parabox

#endif // PARABOX_CORE_LOGGER_HPP
