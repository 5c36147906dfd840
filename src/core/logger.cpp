#include <parabox/core/logger.hpp>

#include <unistd.h>

namespace parabox {

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : level_(static_cast<int>(LogLevel::INFO)), tag_("parabox") {}

void Logger::set_level(LogLevel level) {
    level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::level() const {
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

bool Logger::set_level(const std::string& name) {
    static const LogLevel levels[] = {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR};
    static const char* const names[] = {"debug", "info", "warn", "error"};
    for (size_t i = 0; i < 4; ++i) {
        if (name == names[i]) {
            set_level(levels[i]);
            return true;
        }
    }
    return false;
}

void Logger::set_tag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    tag_ = tag;
}

void Logger::log(LogLevel level, const char* fmt, ...) {
    if (!enabled(level)) return;

    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    char message[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    // Reader threads and the main thread log concurrently
    std::lock_guard<std::mutex> lock(mutex_);
    fprintf(stderr, "[%s] [%s:%d] [%s] %s\n", timestamp, tag_.c_str(),
            static_cast<int>(getpid()), log_level_name(level), message);
    fflush(stderr);
}

} // namespace parabox
