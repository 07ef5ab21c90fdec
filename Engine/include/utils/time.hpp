#pragma once

#include <utils/logger.hpp>

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>

namespace Seed {

/**
 * @brief High-resolution timer.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

private:
    TimePoint start_;
};

/**
 * @brief Counts processed records and reports throughput every `interval` ticks.
 *
 * An interval of 0 disables the periodic lines; finish() always reports.
 */
class ProgressMeter {
public:
    ProgressMeter(std::string label, std::string unit, size_t interval)
        : label_(std::move(label)), unit_(std::move(unit)), interval_(interval) {}

    void tick(size_t n = 1) {
        for (size_t i = 0; i < n; ++i) {
            ++count_;
            if (interval_ != 0 && count_ % interval_ == 0) report(Logger::Level::Progress);
        }
    }

    void finish() const { report(Logger::Level::Success); }

    size_t count() const { return count_; }
    double elapsed_sec() const { return timer_.elapsed_sec(); }

private:
    void report(Logger::Level level) const {
        double secs = timer_.elapsed_sec();
        double rate = secs > 0.0 ? static_cast<double>(count_) / secs : 0.0;
        std::ostringstream oss;
        oss << label_ << ": " << count_ << " " << unit_
            << " (" << std::fixed << std::setprecision(1) << secs << "s, "
            << std::setprecision(0) << rate << " " << unit_ << "/s)";
        Logger::log(level, oss.str());
    }

    std::string label_;
    std::string unit_;
    size_t interval_;
    size_t count_ = 0;
    Timer timer_;
};

} // namespace Seed
