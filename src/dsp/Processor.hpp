/**
 * @file Processor.hpp
 * @brief Base class for block-based mono signal processors.
 *
 * Processors fill or transform one block at a time (pull model): the caller owns
 * the buffer, the processor writes into it in place.
 */

#ifndef TONEGEN_PROCESSOR_HPP
#define TONEGEN_PROCESSOR_HPP

#include <span>
#include <chrono>
#include <cstddef>
#include "PerformanceProfiler.hpp"

namespace tonegen {

/**
 * @brief Base class for mono block processors.
 *
 * Concrete processors implement do_pull(); pull() wraps it with optional
 * nanosecond profiling so the render stage can be checked against its budget.
 */
class Processor {
public:
    /**
     * @brief Performance metrics structure.
     *
     * Only populated when TONEGEN_ENABLE_PROFILING is defined.
     */
    struct PerformanceMetrics {
        std::chrono::nanoseconds last_execution_time{0};
        std::chrono::nanoseconds max_execution_time{0};
        size_t total_blocks_processed{0};
        size_t overruns{0};
    };

    virtual ~Processor() = default;

    /**
     * @brief Process one block in place.
     *
     * @param output Block to fill or transform (mono).
     */
    void pull(std::span<float> output) {
        profiler_.start();
        do_pull(output);
        profiler_.stop();
    }

    /**
     * @brief Reset internal state (phase, memory, delay contents).
     */
    virtual void reset() = 0;

    /**
     * @brief Get performance metrics.
     *
     * Returns zero values when TONEGEN_ENABLE_PROFILING is not defined.
     */
    PerformanceMetrics get_metrics() const {
        return PerformanceMetrics{
            profiler_.elapsed(),
            profiler_.max_execution_time(),
            profiler_.total_blocks_processed(),
            profiler_.overruns()
        };
    }

protected:
    virtual void do_pull(std::span<float> output) = 0;

    PerformanceProfiler profiler_;
};

} // namespace tonegen

#endif // TONEGEN_PROCESSOR_HPP
