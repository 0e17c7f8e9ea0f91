/**
 * @file PerformanceProfiler.hpp
 * @brief Render-time profiling against the real-time block budget.
 *
 * Compile-time optional: with TONEGEN_ENABLE_PROFILING off every method is a no-op.
 */

#ifndef TONEGEN_PERFORMANCE_PROFILER_HPP
#define TONEGEN_PERFORMANCE_PROFILER_HPP

#include <chrono>
#include <cstddef>

namespace tonegen {

/**
 * @brief Measures how long each block takes and counts blocks that overran
 * the period the driver allows for them.
 */
class PerformanceProfiler {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Nanoseconds = std::chrono::nanoseconds;

    PerformanceProfiler() = default;

#if TONEGEN_ENABLE_PROFILING
    void start() {
        start_time_ = Clock::now();
    }

    void stop() {
        execution_time_ = std::chrono::duration_cast<Nanoseconds>(Clock::now() - start_time_);
        if (execution_time_ > max_execution_time_) {
            max_execution_time_ = execution_time_;
        }
        if (budget_ > Nanoseconds::zero() && execution_time_ > budget_) {
            ++overruns_;
        }
        ++total_blocks_processed_;
    }

    /**
     * @brief Set the per-block deadline (block size / sample rate).
     *
     * A zero budget disables overrun counting.
     */
    void set_budget(Nanoseconds budget) { budget_ = budget; }

    Nanoseconds elapsed() const { return execution_time_; }
    Nanoseconds max_execution_time() const { return max_execution_time_; }
    size_t total_blocks_processed() const { return total_blocks_processed_; }
    size_t overruns() const { return overruns_; }

    void reset() {
        execution_time_ = Nanoseconds::zero();
        max_execution_time_ = Nanoseconds::zero();
        total_blocks_processed_ = 0;
        overruns_ = 0;
    }

private:
    TimePoint start_time_;
    Nanoseconds budget_{0};
    Nanoseconds execution_time_{0};
    Nanoseconds max_execution_time_{0};
    size_t total_blocks_processed_{0};
    size_t overruns_{0};

#else
    void start() {}
    void stop() {}
    void set_budget(Nanoseconds) {}
    Nanoseconds elapsed() const { return Nanoseconds::zero(); }
    Nanoseconds max_execution_time() const { return Nanoseconds::zero(); }
    size_t total_blocks_processed() const { return 0; }
    size_t overruns() const { return 0; }
    void reset() {}
#endif
};

} // namespace tonegen

#endif // TONEGEN_PERFORMANCE_PROFILER_HPP
