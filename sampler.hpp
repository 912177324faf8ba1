#pragma once

#include <stdint.h>
#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "call_tree.hpp"
#include "completion.hpp"
#include "result.hpp"
#include "sampling_backend.hpp"
#include "thread_dump.hpp"
#include "thread_dumper.hpp"
#include "thread_grouper.hpp"
#include "tick_hook.hpp"
#include "ticked_aggregator.hpp"

struct SamplerConfig {
    ThreadDumper dumper;
    ThreadGrouper grouper;
    std::chrono::microseconds interval { 4000 };
    // Absolute wall-clock end of the session, if any.
    std::optional<std::chrono::system_clock::time_point> auto_end_time;
    bool ignore_sleeping = false;
    bool ignore_native = false;
    bool force_fallback_backend = false;
    // Only keep samples from host ticks at least this long.
    std::optional<std::chrono::milliseconds> minimum_tick_duration;
    bool verbose = false;

    double interval_ms() const {
        return interval.count() / 1000.0;
    }
};

class SamplerConfigBuilder {
public:
    static constexpr double MAX_SAMPLING_INTERVAL_MS = 60 * 60 * 1000;

    SamplerConfigBuilder& dumper(ThreadDumper dumper);
    SamplerConfigBuilder& grouper(ThreadGrouper grouper);
    SamplerConfigBuilder& sampling_interval(double interval_ms);
    // Relative to the time build() is called.
    SamplerConfigBuilder& complete_after(std::chrono::milliseconds timeout);
    SamplerConfigBuilder& ignore_sleeping(bool value);
    SamplerConfigBuilder& ignore_native(bool value);
    SamplerConfigBuilder& force_fallback_backend(bool value);
    SamplerConfigBuilder& minimum_tick_duration(std::chrono::milliseconds duration);
    SamplerConfigBuilder& verbose(bool value);

    Result<SamplerConfig, std::string> build() const;

private:
    SamplerConfig config;
    double interval_ms = 4;
    std::optional<std::chrono::milliseconds> timeout;
};

enum class SamplerState {
    CREATED,
    RUNNING,
    STOPPED,
    CANCELLED,
    FAILED,
};

const char* to_string(SamplerState state);

// One profiling session. Must be owned by a std::shared_ptr: the worker
// thread keeps the sampler alive until its loop has exited.
class Sampler : public std::enable_shared_from_this<Sampler> {
public:
    Sampler(SamplerConfig config, ThreadDumpSource& source, TickHook* tick_hook = nullptr);
    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;
    ~Sampler();

    // CREATED -> RUNNING. Throws std::logic_error from any other state.
    void start();

    // RUNNING -> STOPPED: waits out the tick in progress, freezes the data
    // and resolves the completion.
    bool stop();

    // CREATED|RUNNING -> CANCELLED: discards the data.
    bool cancel();

    SamplerState state() const {
        return current_state.load(std::memory_order_acquire);
    }

    bool is_running() const {
        return state() == SamplerState::RUNNING;
    }

    const SamplerConfig& config() const {
        return session_config;
    }

    std::chrono::system_clock::time_point start_time() const;

    std::optional<std::chrono::system_clock::time_point> auto_end_time() const {
        return session_config.auto_end_time;
    }

    // Set once the session has left RUNNING.
    std::optional<std::chrono::system_clock::time_point> end_time() const;

    // True when the session ended because its auto-end time passed.
    bool timed_out() const {
        return reached_auto_end.load(std::memory_order_acquire);
    }

    // "native" or "fallback"; empty until started.
    std::string backend_name() const;

    Completion& completion() {
        return done;
    }

    const CallTreeAggregator& data() const {
        return aggregator;
    }

    uint64_t total_samples() const {
        return aggregator.total_samples();
    }

    uint64_t tick_count() const {
        return ticks.load(std::memory_order_relaxed);
    }

    // Capture one tick. Exposed for hosts that drive sampling themselves and
    // for tests; the worker thread calls it at every interval.
    bool sample_once();

private:
    const SamplerConfig session_config;
    ThreadDumpSource& source;
    TickHook* tick_hook;

    std::atomic<SamplerState> current_state { SamplerState::CREATED };
    std::atomic<int64_t> started_at_ms { 0 };
    std::atomic<int64_t> ended_at_ms { -1 };
    std::atomic<bool> reached_auto_end { false };

    CallTreeAggregator aggregator;
    std::unique_ptr<TickedAggregator> ticked;
    Completion done;

    mutable std::mutex control_mutex;
    std::unique_ptr<SamplingBackend> backend;
    std::string backend_label;
    std::thread worker;
    std::atomic<pid_t> worker_tid { 0 };
    std::optional<uint64_t> tick_listener;
    std::atomic<uint64_t> ticks { 0 };

    void run_worker();
    void record_sample(const std::string& group, const std::vector<StackFrame>& frames);
    bool stop_session(bool auto_end);
    void halt();
    void await_worker();
    void mark_ended();
    bool fail(const std::string& message);
};
