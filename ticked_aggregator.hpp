#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "call_tree.hpp"

// Buffers samples per host tick and commits a tick's samples only if the tick
// lasted at least the minimum duration.
class TickedAggregator {
public:
    using Clock = std::chrono::steady_clock;

    TickedAggregator(CallTreeAggregator& tree, std::chrono::milliseconds minimum_tick_duration)
        : tree(tree), minimum_tick_duration(minimum_tick_duration) {}

    void begin(Clock::time_point now);

    void record(const std::string& group, const std::vector<StackFrame>& frames, double weight_ms);

    // Tick boundary: closes the current tick and opens the next one.
    void on_tick(Clock::time_point now);

    // Closes the final tick; no samples are buffered afterwards.
    void complete(Clock::time_point now);

    void discard();

    uint64_t committed_ticks() const;
    uint64_t dropped_ticks() const;

private:
    struct PendingSample {
        std::string group;
        std::vector<StackFrame> frames;
        double weight_ms;
    };

    CallTreeAggregator& tree;
    const std::chrono::milliseconds minimum_tick_duration;

    mutable std::mutex mutex;
    std::optional<Clock::time_point> tick_start;
    std::vector<PendingSample> pending;
    bool closed = false;
    uint64_t committed = 0;
    uint64_t dropped = 0;

    void close_tick_locked(Clock::time_point now);
};
