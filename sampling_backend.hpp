#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "result.hpp"

// Drives the capture loop of a sampler on the calling (worker) thread.
class SamplingBackend {
public:
    // Returns false to end the loop.
    using TickFn = std::function<bool()>;

    virtual ~SamplingBackend() = default;

    virtual const char* name() const = 0;

    // Blocks until tick() returns false or halt() is called. Fails only if the
    // scheduling mechanism itself breaks.
    virtual Status run(std::chrono::microseconds interval, const TickFn& tick) = 0;

    // Thread-safe. Makes run() return at the next opportunity.
    virtual void halt() = 0;
};

// Sleep loop that subtracts the tick's own duration from the interval.
class FallbackBackend : public SamplingBackend {
public:
    const char* name() const override { return "fallback"; }

    Status run(std::chrono::microseconds interval, const TickFn& tick) override;

    void halt() override;

private:
    std::mutex mutex;
    std::condition_variable cv;
    bool halted = false;
};

// Periodic absolute-deadline timerfd on CLOCK_MONOTONIC, woken early by an
// eventfd on halt.
class TimerfdBackend : public SamplingBackend {
public:
    static Result<std::unique_ptr<TimerfdBackend>, std::string> create();

    TimerfdBackend(const TimerfdBackend&) = delete;
    TimerfdBackend& operator=(const TimerfdBackend&) = delete;
    ~TimerfdBackend() override;

    const char* name() const override { return "native"; }

    Status run(std::chrono::microseconds interval, const TickFn& tick) override;

    void halt() override;

private:
    TimerfdBackend(int timer_fd, int wake_fd) : timer_fd(timer_fd), wake_fd(wake_fd) {}

    int timer_fd;
    int wake_fd;
    std::atomic<bool> halted { false };
};

// Native backend unless forced off or unavailable on this kernel.
std::unique_ptr<SamplingBackend> make_sampling_backend(bool force_fallback, bool verbose);
