#include "ticked_aggregator.hpp"

using std::string;
using std::vector;

void TickedAggregator::begin(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex);
    tick_start = now;
}

void TickedAggregator::record(const string& group, const vector<StackFrame>& frames, double weight_ms) {
    std::lock_guard<std::mutex> lock(mutex);
    if (closed) {
        return;
    }
    pending.push_back(PendingSample { group, frames, weight_ms });
}

void TickedAggregator::close_tick_locked(Clock::time_point now) {
    bool long_enough = tick_start.has_value() && now - *tick_start >= minimum_tick_duration;
    if (long_enough) {
        for (const auto& sample: pending) {
            if (!tree.record(sample.group, sample.frames, sample.weight_ms)) {
                break;
            }
        }
        ++committed;
    } else {
        ++dropped;
    }
    pending.clear();
    tick_start = now;
}

void TickedAggregator::on_tick(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex);
    if (closed) {
        return;
    }
    close_tick_locked(now);
}

void TickedAggregator::complete(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex);
    if (closed) {
        return;
    }
    close_tick_locked(now);
    closed = true;
}

void TickedAggregator::discard() {
    std::lock_guard<std::mutex> lock(mutex);
    pending.clear();
    closed = true;
}

uint64_t TickedAggregator::committed_ticks() const {
    std::lock_guard<std::mutex> lock(mutex);
    return committed;
}

uint64_t TickedAggregator::dropped_ticks() const {
    std::lock_guard<std::mutex> lock(mutex);
    return dropped;
}
