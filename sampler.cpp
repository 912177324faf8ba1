#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <unistd.h>
#include <sys/syscall.h>

#include "sampler.hpp"

using std::string;
using std::vector;
using std::move;
using std::chrono::system_clock;

static int64_t to_epoch_ms(system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

static system_clock::time_point from_epoch_ms(int64_t ms) {
    return system_clock::time_point(std::chrono::milliseconds(ms));
}

SamplerConfigBuilder& SamplerConfigBuilder::dumper(ThreadDumper dumper) {
    config.dumper = move(dumper);
    return *this;
}

SamplerConfigBuilder& SamplerConfigBuilder::grouper(ThreadGrouper grouper) {
    config.grouper = grouper;
    return *this;
}

SamplerConfigBuilder& SamplerConfigBuilder::sampling_interval(double value) {
    interval_ms = value;
    return *this;
}

SamplerConfigBuilder& SamplerConfigBuilder::complete_after(std::chrono::milliseconds value) {
    timeout = value;
    return *this;
}

SamplerConfigBuilder& SamplerConfigBuilder::ignore_sleeping(bool value) {
    config.ignore_sleeping = value;
    return *this;
}

SamplerConfigBuilder& SamplerConfigBuilder::ignore_native(bool value) {
    config.ignore_native = value;
    return *this;
}

SamplerConfigBuilder& SamplerConfigBuilder::force_fallback_backend(bool value) {
    config.force_fallback_backend = value;
    return *this;
}

SamplerConfigBuilder& SamplerConfigBuilder::minimum_tick_duration(std::chrono::milliseconds duration) {
    config.minimum_tick_duration = duration;
    return *this;
}

SamplerConfigBuilder& SamplerConfigBuilder::verbose(bool value) {
    config.verbose = value;
    return *this;
}

Result<SamplerConfig, string> SamplerConfigBuilder::build() const {
    if (!std::isfinite(interval_ms) || !(interval_ms > 0)) {
        return ResultInit::err(string("Sampling interval must be greater than zero"));
    }
    if (interval_ms > MAX_SAMPLING_INTERVAL_MS) {
        return ResultInit::err(string("Sampling interval must not exceed one hour"));
    }
    if (timeout.has_value() && timeout->count() <= 0) {
        return ResultInit::err(string("Timeout must be greater than zero"));
    }
    if (config.minimum_tick_duration.has_value() && config.minimum_tick_duration->count() < 0) {
        return ResultInit::err(string("Minimum tick duration must not be negative"));
    }

    SamplerConfig result = config;
    result.interval = std::chrono::microseconds((int64_t) (interval_ms * 1000));
    if (result.interval.count() == 0) {
        result.interval = std::chrono::microseconds(1);
    }
    if (timeout.has_value()) {
        result.auto_end_time = system_clock::now() + *timeout;
    }
    return ResultInit::ok(move(result));
}

const char* to_string(SamplerState state) {
    switch (state) {
        case SamplerState::CREATED:
            return "created";
        case SamplerState::RUNNING:
            return "running";
        case SamplerState::STOPPED:
            return "stopped";
        case SamplerState::CANCELLED:
            return "cancelled";
        case SamplerState::FAILED:
            return "failed";
    }
    return "unknown";
}

Sampler::Sampler(SamplerConfig config, ThreadDumpSource& source, TickHook* tick_hook)
    : session_config(move(config)), source(source), tick_hook(tick_hook) {
    started_at_ms = to_epoch_ms(system_clock::now());
    if (session_config.minimum_tick_duration.has_value()) {
        ticked = std::make_unique<TickedAggregator>(aggregator, *session_config.minimum_tick_duration);
    }
}

Sampler::~Sampler() {
    {
        std::lock_guard<std::mutex> lock(control_mutex);
        if (backend) {
            backend->halt();
        }
        if (tick_listener.has_value() && tick_hook != nullptr) {
            tick_hook->remove_listener(*tick_listener);
        }
    }
    if (worker.joinable()) {
        // the worker may drop the last reference to us on its way out
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else {
            worker.join();
        }
    }
}

system_clock::time_point Sampler::start_time() const {
    return from_epoch_ms(started_at_ms.load(std::memory_order_relaxed));
}

std::optional<system_clock::time_point> Sampler::end_time() const {
    int64_t ms = ended_at_ms.load(std::memory_order_acquire);
    if (ms < 0) {
        return std::nullopt;
    }
    return from_epoch_ms(ms);
}

string Sampler::backend_name() const {
    std::lock_guard<std::mutex> lock(control_mutex);
    return backend_label;
}

void Sampler::start() {
    std::lock_guard<std::mutex> lock(control_mutex);

    SamplerState expected = SamplerState::CREATED;
    if (!current_state.compare_exchange_strong(expected, SamplerState::RUNNING)) {
        throw std::logic_error(string("Sampler::start called in state ") + to_string(expected));
    }

    started_at_ms = to_epoch_ms(system_clock::now());
    if (ticked) {
        ticked->begin(TickedAggregator::Clock::now());
        if (tick_hook != nullptr) {
            TickedAggregator* buffer = ticked.get();
            tick_listener = tick_hook->add_listener([buffer](uint64_t) {
                buffer->on_tick(TickedAggregator::Clock::now());
            });
        }
    }

    backend = make_sampling_backend(session_config.force_fallback_backend, session_config.verbose);
    backend_label = backend->name();

    if (session_config.verbose) {
        std::cerr << "Sampler started (backend: " << backend_label << ", interval: "
            << session_config.interval_ms() << "ms, threads: " << session_config.dumper.describe() << ")\n";
    }

    std::shared_ptr<Sampler> self = shared_from_this();
    worker = std::thread([self] {
        self->run_worker();
    });
}

void Sampler::run_worker() {
    worker_tid.store((pid_t) syscall(SYS_gettid), std::memory_order_relaxed);

    Status status = ResultInit::ok();
    try {
        status = backend->run(session_config.interval, [this] { return sample_once(); });
    } catch (const std::exception& e) {
        status = ResultInit::err(string(e.what()));
    } catch (...) {
        status = ResultInit::err(string("unknown exception in sampling loop"));
    }

    if (!status.isOk()) {
        fail(status.getErrRef());
    }
}

void Sampler::record_sample(const string& group, const vector<StackFrame>& frames) {
    if (ticked) {
        ticked->record(group, frames, session_config.interval_ms());
    } else {
        aggregator.record(group, frames, session_config.interval_ms());
    }
}

bool Sampler::sample_once() {
    if (state() != SamplerState::RUNNING) {
        return false;
    }

    if (session_config.auto_end_time.has_value() && system_clock::now() >= *session_config.auto_end_time) {
        stop_session(true);
        return false;
    }

    auto dump = source.dump();
    if (!dump.isOk()) {
        if (session_config.verbose) {
            std::cerr << "Thread dump failed, skipping tick: " << dump.getErrRef() << "\n";
        }
        return true;
    }

    const vector<ThreadSnapshot>& threads = dump.getOkRef();
    pid_t self_tid = worker_tid.load(std::memory_order_relaxed);
    for (const ThreadSnapshot* thread: session_config.dumper.select(threads, self_tid)) {
        if (session_config.ignore_sleeping && thread->is_sleeping()) {
            continue;
        }
        if (session_config.ignore_native && thread->is_native_on_top()) {
            continue;
        }
        record_sample(session_config.grouper.group_key(thread->name), thread->frames);
    }

    ticks.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void Sampler::halt() {
    std::lock_guard<std::mutex> lock(control_mutex);
    if (backend) {
        backend->halt();
    }
    if (tick_listener.has_value() && tick_hook != nullptr) {
        tick_hook->remove_listener(*tick_listener);
        tick_listener.reset();
    }
}

// Waits for the worker to leave its loop. A no-op on the worker itself.
void Sampler::await_worker() {
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(control_mutex);
        if (!worker.joinable() || worker.get_id() == std::this_thread::get_id()) {
            return;
        }
        finished = move(worker);
    }
    finished.join();
}

void Sampler::mark_ended() {
    ended_at_ms.store(to_epoch_ms(system_clock::now()), std::memory_order_release);
}

bool Sampler::stop() {
    return stop_session(false);
}

bool Sampler::stop_session(bool auto_end) {
    SamplerState expected = SamplerState::RUNNING;
    if (!current_state.compare_exchange_strong(expected, SamplerState::STOPPED)) {
        return false;
    }
    reached_auto_end.store(auto_end, std::memory_order_release);

    halt();
    await_worker();
    mark_ended();
    if (ticked) {
        ticked->complete(TickedAggregator::Clock::now());
    }
    aggregator.freeze();

    if (session_config.verbose) {
        std::cerr << "Sampler stopped after " << tick_count() << " ticks, " << total_samples() << " samples\n";
    }

    done.resolve(CompletionOutcome::SUCCESS);
    return true;
}

bool Sampler::cancel() {
    SamplerState expected = current_state.load(std::memory_order_acquire);
    while (expected == SamplerState::CREATED || expected == SamplerState::RUNNING) {
        if (current_state.compare_exchange_weak(expected, SamplerState::CANCELLED)) {
            halt();
            await_worker();
            mark_ended();
            if (ticked) {
                ticked->discard();
            }
            aggregator.discard();

            if (session_config.verbose) {
                std::cerr << "Sampler cancelled\n";
            }

            done.resolve(CompletionOutcome::CANCELLED);
            return true;
        }
    }
    return false;
}

bool Sampler::fail(const string& message) {
    SamplerState expected = SamplerState::RUNNING;
    if (!current_state.compare_exchange_strong(expected, SamplerState::FAILED)) {
        return false;
    }

    halt();
    mark_ended();
    if (ticked) {
        ticked->discard();
    }
    aggregator.freeze();

    std::cerr << "Sampler failed: " << message << "\n";
    done.resolve(CompletionOutcome::FAILED, message);
    return true;
}
