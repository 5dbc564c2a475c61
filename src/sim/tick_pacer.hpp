// src/sim/tick_pacer.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <thread>

namespace sim {

/**
 * TickPacer - holds the control loop to a fixed wall-clock rate
 *
 * Deadlines are absolute (epoch + n * dt) so lateness on one tick does not
 * shift the following ones. Waiting is a coarse sleep_until followed by a
 * short yield-spin for the last few tens of microseconds.
 */
class TickPacer {
public:
    struct Stats {
        size_t ticks = 0;
        size_t deadline_misses = 0;
        double max_lateness_us = 0.0;
        double avg_lateness_us = 0.0;
        double max_work_us = 0.0;
    };

    using Clock = std::chrono::steady_clock;

    explicit TickPacer(double dt_s, double spin_us = 50.0)
        : period_(std::chrono::nanoseconds(static_cast<int64_t>(dt_s * 1e9))),
          spin_(std::chrono::nanoseconds(static_cast<int64_t>(spin_us * 1e3)))
    {
        reset();
    }

    void reset() {
        stats_ = Stats{};
        lateness_sum_us_ = 0.0;
        epoch_ = Clock::now();
        work_start_ = epoch_;
    }

    // Call at the top of each tick
    void begin_tick() { work_start_ = Clock::now(); }

    /**
     * Sleep until the next tick deadline.
     * Returns false if the deadline had already passed.
     */
    bool wait_next() {
        const auto now = Clock::now();
        const double work_us = std::chrono::duration<double, std::micro>(now - work_start_).count();
        stats_.max_work_us = std::max(stats_.max_work_us, work_us);

        stats_.ticks++;
        const auto deadline = epoch_ + period_ * static_cast<int64_t>(stats_.ticks);

        if (now > deadline) {
            const double late_us = std::chrono::duration<double, std::micro>(now - deadline).count();
            stats_.deadline_misses++;
            stats_.max_lateness_us = std::max(stats_.max_lateness_us, late_us);
            lateness_sum_us_ += late_us;
            stats_.avg_lateness_us = lateness_sum_us_ / static_cast<double>(stats_.deadline_misses);
            return false;
        }

        if (deadline - now > spin_) {
            std::this_thread::sleep_until(deadline - spin_);
        }
        while (Clock::now() < deadline) {
            std::this_thread::yield();
        }
        return true;
    }

    // Wall time since reset() minus nominal time of the ticks waited for
    double drift_s() const {
        const auto wall = Clock::now() - epoch_;
        const auto nominal = period_ * static_cast<int64_t>(stats_.ticks);
        return std::chrono::duration<double>(wall - nominal).count();
    }

    const Stats& stats() const { return stats_; }

private:
    std::chrono::nanoseconds period_;
    std::chrono::nanoseconds spin_;
    Clock::time_point epoch_;
    Clock::time_point work_start_;
    double lateness_sum_us_ = 0.0;
    Stats stats_;
};

} // namespace sim
