#pragma once

#include <stdint.h>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

// Host-driven tick notifications, for hosts that run a fixed-rate main loop.
// Listeners run on the host's thread, under the hook's lock, and must not
// add or remove listeners themselves.
class TickHook {
public:
    using Listener = std::function<void(uint64_t tick)>;

    uint64_t add_listener(Listener listener) {
        std::lock_guard<std::mutex> lock(mutex);
        uint64_t id = next_id++;
        listeners.emplace(id, std::move(listener));
        return id;
    }

    void remove_listener(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        listeners.erase(id);
    }

    // Called by the host at the end of every tick.
    void on_tick() {
        uint64_t tick = current.fetch_add(1, std::memory_order_relaxed) + 1;
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& entry: listeners) {
            entry.second(tick);
        }
    }

private:
    std::mutex mutex;
    std::map<uint64_t, Listener> listeners;
    uint64_t next_id = 1;
    std::atomic<uint64_t> current { 0 };
};
