// src/app/cycle_timer.hpp
#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <thread>

namespace app {

/**
 * CycleTimer - Paces the control loop on absolute deadlines.
 *
 * Deadlines are epoch + n * period, so slow cycles do not accumulate
 * drift. A cycle that overruns its deadline is counted as a miss and the
 * next cycle starts immediately. Sleeping happens in slices so a stop
 * request is honoured within ~100 ms. A period of 0 disables pacing.
 */
class CycleTimer {
public:
    struct Stats {
        size_t total_cycles = 0;
        size_t deadline_misses = 0;
        double max_lateness_ms = 0.0;
        double max_loop_time_ms = 0.0;
    };

    explicit CycleTimer(double period_s)
        : period_ns_(static_cast<int64_t>(period_s * 1e9))
    {
        reset();
    }

    void reset() {
        cycle_count_ = 0;
        stats_ = Stats{};
        epoch_ = std::chrono::steady_clock::now();
        last_loop_start_ = epoch_;
    }

    /**
     * Sleep until the next cycle deadline or until stop is set.
     *
     * Returns false if the deadline had already passed.
     */
    bool wait_for_next_cycle(const std::atomic<bool>& stop) {
        using namespace std::chrono;

        cycle_count_++;
        if (period_ns_ <= 0) return true;

        const auto deadline = epoch_ + nanoseconds(cycle_count_ * period_ns_);
        auto now = steady_clock::now();

        if (now > deadline) {
            stats_.deadline_misses++;
            const double lateness_ms = duration<double, std::milli>(now - deadline).count();
            stats_.max_lateness_ms = std::max(stats_.max_lateness_ms, lateness_ms);
            return false;
        }

        const auto slice = milliseconds(100);
        while (now < deadline && !stop.load()) {
            std::this_thread::sleep_until(std::min(deadline, now + slice));
            now = steady_clock::now();
        }
        return true;
    }

    void mark_loop_start() {
        last_loop_start_ = std::chrono::steady_clock::now();
    }

    void update_loop_stats() {
        const auto loop = std::chrono::steady_clock::now() - last_loop_start_;
        const double loop_ms = std::chrono::duration<double, std::milli>(loop).count();
        stats_.max_loop_time_ms = std::max(stats_.max_loop_time_ms, loop_ms);
        stats_.total_cycles++;
    }

    /**
     * Wall-clock time since reset (in seconds)
     */
    double get_elapsed_s() const {
        auto elapsed = std::chrono::steady_clock::now() - epoch_;
        return std::chrono::duration<double>(elapsed).count();
    }

    const Stats& get_stats() const { return stats_; }

private:
    int64_t period_ns_;
    int64_t cycle_count_ = 0;

    std::chrono::steady_clock::time_point epoch_;
    std::chrono::steady_clock::time_point last_loop_start_;

    Stats stats_;
};

} // namespace app
