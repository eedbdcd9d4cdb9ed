#include "gitmark/perf.hpp"

#include <algorithm>
#include <iomanip>
#include <ios>
#include <map>
#include <ostream>
#include <utility>

namespace gitmark::perf {

namespace {

double to_milliseconds(std::chrono::steady_clock::duration duration) {
    return std::chrono::duration<double, std::milli>(duration).count();
}

} // namespace

Manager& Manager::instance() {
    static Manager manager;
    return manager;
}

void Manager::set_enabled(bool enabled) {
    enabled_ = enabled;
    clear();
}

void Manager::add_duration(std::string_view label, std::chrono::steady_clock::duration duration) {
    if (!enabled_) return;
    std::scoped_lock lock{mutex_};
    auto& timing = timings_[std::string(label)];
    timing.total += duration;
    timing.max = std::max(timing.max, duration);
    ++timing.count;
}

void Manager::increment(std::string_view counter, std::uint64_t delta) {
    if (!enabled_) return;
    std::scoped_lock lock{mutex_};
    counters_[std::string(counter)] += delta;
}

std::uint64_t Manager::counter(std::string_view name) const {
    std::scoped_lock lock{mutex_};
    auto it = counters_.find(std::string(name));
    return it == counters_.end() ? 0 : it->second;
}

void Manager::report(std::ostream& os) const {
    if (!enabled_) return;
    std::scoped_lock lock{mutex_};

    if (!timings_.empty()) {
        os << "[perf] Timings (ms)\n";
        const std::map<std::string, Timing> sorted(timings_.begin(), timings_.end());
        const auto previous_flags = os.flags();
        const auto previous_precision = os.precision();
        os.setf(std::ios::fixed, std::ios::floatfield);
        for (const auto& [label, timing] : sorted) {
            const double total = to_milliseconds(timing.total);
            const double average = timing.count > 0 ? total / static_cast<double>(timing.count) : 0.0;
            os << "  " << label << ": total=" << std::setprecision(3) << total << " avg=" << average
               << " max=" << to_milliseconds(timing.max) << " count=" << timing.count << '\n';
        }
        os.flags(previous_flags);
        os.precision(previous_precision);
    }

    if (!counters_.empty()) {
        os << "[perf] Counters\n";
        const std::map<std::string, std::uint64_t> sorted(counters_.begin(), counters_.end());
        for (const auto& [name, value] : sorted) {
            os << "  " << name << ": " << value << '\n';
        }
    }
}

void Manager::clear() {
    std::scoped_lock lock{mutex_};
    timings_.clear();
    counters_.clear();
}

ScopedTimer::ScopedTimer(std::string label)
    : active_{Manager::instance().enabled()} {
    if (!active_) return;
    label_ = std::move(label);
    start_ = std::chrono::steady_clock::now();
}

ScopedTimer::~ScopedTimer() {
    if (!active_) return;
    Manager::instance().add_duration(label_, std::chrono::steady_clock::now() - start_);
}

} // namespace gitmark::perf
