#pragma once

#include <mutex>
#include <ostream>
#include <string_view>

namespace gitmark {

enum class LogLevel {
    Error = 0,
    Warn,
    Info,
    Debug,
    Trace,
};

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept { return level <= level_; }

    void set_output(std::ostream* stream) noexcept;

    void log(LogLevel level, std::string_view component, std::string_view message);

    void error(std::string_view component, std::string_view message) { log(LogLevel::Error, component, message); }
    void warn(std::string_view component, std::string_view message) { log(LogLevel::Warn, component, message); }
    void info(std::string_view component, std::string_view message) { log(LogLevel::Info, component, message); }
    void debug(std::string_view component, std::string_view message) { log(LogLevel::Debug, component, message); }

private:
    Logger();

    std::ostream* stream_;
    LogLevel level_;
    std::mutex mutex_;
};

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

} // namespace gitmark
