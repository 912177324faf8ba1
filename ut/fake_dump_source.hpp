#pragma once

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "thread_dump.hpp"

inline StackFrame Frame(const std::string& class_name, const std::string& method_name, const std::string& descriptor = "", bool native = false) {
    StackFrame frame;
    frame.class_name = class_name;
    frame.method_name = method_name;
    frame.descriptor = descriptor;
    frame.native = native;
    return frame;
}

inline ThreadSnapshot Thread(pid_t tid, const std::string& name, std::vector<StackFrame> frames, char state = 'R') {
    ThreadSnapshot thread;
    thread.tid = tid;
    thread.name = name;
    thread.state = state;
    thread.frames = std::move(frames);
    return thread;
}

// Returns the same snapshot on every dump, or an error while failing is set.
class FakeDumpSource : public ThreadDumpSource {
public:
    explicit FakeDumpSource(std::vector<ThreadSnapshot> threads = {}) : threads(std::move(threads)) {}

    Result<std::vector<ThreadSnapshot>, std::string> dump() override {
        dumps.fetch_add(1);
        if (failing.load()) {
            return ResultInit::err(std::string("target went away"));
        }
        std::lock_guard<std::mutex> lock(mutex);
        return ResultInit::ok(std::vector<ThreadSnapshot>(threads));
    }

    void set_threads(std::vector<ThreadSnapshot> value) {
        std::lock_guard<std::mutex> lock(mutex);
        threads = std::move(value);
    }

    std::atomic<bool> failing { false };
    std::atomic<uint64_t> dumps { 0 };

private:
    std::mutex mutex;
    std::vector<ThreadSnapshot> threads;
};

// Throws from dump(), which ends the session as FAILED.
class ThrowingDumpSource : public ThreadDumpSource {
public:
    Result<std::vector<ThreadSnapshot>, std::string> dump() override {
        throw std::runtime_error("unwinder crashed");
    }
};
