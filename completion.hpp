#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class CompletionOutcome {
    SUCCESS,
    CANCELLED,
    FAILED,
};

struct CompletionResult {
    CompletionOutcome outcome;
    // Set for FAILED only.
    std::string error;

    bool succeeded() const {
        return outcome == CompletionOutcome::SUCCESS;
    }
};

// One-shot result channel. The first resolve() wins; later ones are ignored.
// Any number of threads may wait or register callbacks.
class Completion {
public:
    using Callback = std::function<void(const CompletionResult&)>;

    bool resolve(CompletionOutcome outcome, std::string error = std::string()) {
        std::vector<Callback> to_run;
        CompletionResult resolved { outcome, std::move(error) };
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (result.has_value()) {
                return false;
            }
            result = resolved;
            to_run.swap(callbacks);
        }
        cv.notify_all();

        // callbacks run outside the lock so they may query this object
        for (const auto& callback: to_run) {
            callback(resolved);
        }
        return true;
    }

    std::optional<CompletionResult> peek() const {
        std::lock_guard<std::mutex> lock(mutex);
        return result;
    }

    CompletionResult wait() const {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return result.has_value(); });
        return *result;
    }

    template <typename Rep, typename Period>
    std::optional<CompletionResult> wait_for(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(mutex);
        if (!cv.wait_for(lock, timeout, [this] { return result.has_value(); })) {
            return std::nullopt;
        }
        return result;
    }

    // Runs immediately on the calling thread when already resolved, otherwise
    // on the thread that resolves.
    void on_complete(Callback callback) {
        std::optional<CompletionResult> resolved;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!result.has_value()) {
                callbacks.push_back(std::move(callback));
                return;
            }
            resolved = result;
        }
        callback(*resolved);
    }

private:
    mutable std::mutex mutex;
    mutable std::condition_variable cv;
    std::optional<CompletionResult> result;
    std::vector<Callback> callbacks;
};
