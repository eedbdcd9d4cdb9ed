#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace gitmark::perf {

class Manager {
public:
    static Manager& instance();

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept { return enabled_; }

    void add_duration(std::string_view label, std::chrono::steady_clock::duration duration);
    void increment(std::string_view counter, std::uint64_t delta = 1);
    [[nodiscard]] std::uint64_t counter(std::string_view name) const;

    void report(std::ostream& os) const;
    void clear();

private:
    Manager() = default;

    struct Timing {
        std::chrono::steady_clock::duration total{};
        std::chrono::steady_clock::duration max{};
        std::uint64_t count{0};
    };

    bool enabled_{false};
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Timing> timings_;
    std::unordered_map<std::string, std::uint64_t> counters_;
};

/// Adds the time between construction and destruction to `label`.
class ScopedTimer {
public:
    explicit ScopedTimer(std::string label);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string label_;
    std::chrono::steady_clock::time_point start_{};
    bool active_{false};
};

} // namespace gitmark::perf
