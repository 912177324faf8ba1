#pragma once

#include <stdint.h>
#include <sys/types.h>
#include <vector>
#include <string>

#include "result.hpp"

struct StackFrame {
    std::string class_name;
    std::string method_name;
    // Parameter list as reported by the runtime, e.g. "(int,string)". May be empty.
    std::string descriptor;
    // Source line or code offset within the method, 0 when unknown.
    uint32_t line = 0;
    // Not resolved through the managed runtime's symbol map.
    bool native = false;
};

struct ThreadSnapshot {
    pid_t tid = 0;
    std::string name;
    // Scheduler state letter as in /proc/<tid>/stat ('R', 'S', 'D', ...).
    char state = 'R';
    // Innermost call first.
    std::vector<StackFrame> frames;

    bool is_sleeping() const {
        return state == 'S' || state == 'D';
    }

    bool is_native_on_top() const {
        return !frames.empty() && frames.front().native;
    }
};

// Host provider of the live thread set. A failed dump is treated as an empty
// tick by the sampler, never as a session failure.
class ThreadDumpSource {
public:
    virtual ~ThreadDumpSource() = default;

    virtual Result<std::vector<ThreadSnapshot>, std::string> dump() = 0;
};
