#pragma once

#include <functional>
#include <memory>
#include <string>

#include "sampler.hpp"
#include "thread_dump.hpp"
#include "tick_hook.hpp"

// Owns the single active profiling session of a host. Exclusivity is a
// compare-and-set on one shared_ptr; no lock is held while sampling.
class ProfilerService {
public:
    using ErrorCallback = std::function<void(const std::string& message)>;

    explicit ProfilerService(ThreadDumpSource& source, TickHook* tick_hook = nullptr)
        : source(source), tick_hook(tick_hook), slot(std::make_shared<ActiveSlot>()) {}
    ProfilerService(const ProfilerService&) = delete;
    ProfilerService& operator=(const ProfilerService&) = delete;

    // Registers a new, not yet started sampler. Returns nullptr and calls
    // on_error once if a sampler is already active or the config is unusable.
    std::shared_ptr<Sampler> create(SamplerConfig config, const ErrorCallback& on_error);

    std::shared_ptr<Sampler> active() const;

    // Forgets the active sampler without stopping it, but only while it is
    // still `expected`. Returns false if another session has taken its place.
    bool clear(const std::shared_ptr<Sampler>& expected);

    // Stops the active sampler if it is running, then forgets it.
    void clear_and_stop();

    // Cancels the active sampler, then forgets it.
    void cancel_active();

    bool supports_ticks() const {
        return tick_hook != nullptr;
    }

private:
    // Shared with completion callbacks, which may outlive the service.
    struct ActiveSlot {
        std::shared_ptr<Sampler> sampler;

        bool clear_if(const std::shared_ptr<Sampler>& expected);
    };

    ThreadDumpSource& source;
    TickHook* tick_hook;
    std::shared_ptr<ActiveSlot> slot;
};
