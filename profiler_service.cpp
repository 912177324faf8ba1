#include <atomic>
#include <utility>

#include "profiler_service.hpp"

using std::shared_ptr;
using std::string;

shared_ptr<Sampler> ProfilerService::create(SamplerConfig config, const ErrorCallback& on_error) {
    if (config.minimum_tick_duration.has_value() && tick_hook == nullptr) {
        on_error("Tick counting is not supported");
        return nullptr;
    }

    if (std::atomic_load(&slot->sampler) != nullptr) {
        on_error("Another profiler is already active!");
        return nullptr;
    }

    auto sampler = std::make_shared<Sampler>(std::move(config), source, tick_hook);

    shared_ptr<Sampler> expected;
    if (!std::atomic_compare_exchange_strong(&slot->sampler, &expected, sampler)) {
        on_error("Another profiler is already active!");
        return nullptr;
    }

    // abnormal endings must not leave a stale active session behind
    std::weak_ptr<ActiveSlot> weak_slot = slot;
    std::weak_ptr<Sampler> weak_sampler = sampler;
    sampler->completion().on_complete([weak_slot, weak_sampler](const CompletionResult& result) {
        if (result.succeeded()) {
            return;
        }
        auto owner = weak_slot.lock();
        auto ended = weak_sampler.lock();
        if (owner && ended) {
            owner->clear_if(ended);
        }
    });

    return sampler;
}

shared_ptr<Sampler> ProfilerService::active() const {
    return std::atomic_load(&slot->sampler);
}

bool ProfilerService::ActiveSlot::clear_if(const shared_ptr<Sampler>& expected) {
    shared_ptr<Sampler> compare = expected;
    return std::atomic_compare_exchange_strong(&sampler, &compare, shared_ptr<Sampler>());
}

bool ProfilerService::clear(const shared_ptr<Sampler>& expected) {
    return expected && slot->clear_if(expected);
}

void ProfilerService::clear_and_stop() {
    shared_ptr<Sampler> sampler = std::atomic_exchange(&slot->sampler, shared_ptr<Sampler>());
    if (sampler && sampler->is_running()) {
        sampler->stop();
    }
}

void ProfilerService::cancel_active() {
    shared_ptr<Sampler> sampler = std::atomic_exchange(&slot->sampler, shared_ptr<Sampler>());
    if (sampler) {
        sampler->cancel();
    }
}
