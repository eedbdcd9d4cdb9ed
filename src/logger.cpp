#include "gitmark/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace gitmark {

std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return "error";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Info:
        return "info";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Trace:
        return "trace";
    }
    return "unknown";
}

Logger::Logger()
    : stream_{&std::clog}, level_{LogLevel::Error} {}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) noexcept {
    level_ = level;
}

LogLevel Logger::level() const noexcept {
    return level_;
}

void Logger::set_output(std::ostream* stream) noexcept {
    std::scoped_lock lock{mutex_};
    stream_ = stream != nullptr ? stream : &std::clog;
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &seconds);
#else
    localtime_r(&seconds, &tm);
#endif

    std::scoped_lock lock{mutex_};
    (*stream_) << std::put_time(&tm, "%H:%M:%S") << ' ' << to_string(level) << " | " << component << ": "
               << message << '\n';
}

} // namespace gitmark
