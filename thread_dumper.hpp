#pragma once

#include <sys/types.h>
#include <vector>
#include <string>
#include <memory>
#include <functional>

#include "thread_dump.hpp"

namespace re2 {
class RE2;
}

// Chooses which of the live threads are sampled on each tick.
struct ThreadDumper {
    enum class Kind {
        ALL,
        SPECIFIC,
        REGEX,
        DEFAULT,
    };

    using Selector = std::function<bool(const ThreadSnapshot&)>;

    Kind kind = Kind::ALL;
    // SPECIFIC: lower-cased names. REGEX: pattern sources.
    std::vector<std::string> names;
    std::vector<std::shared_ptr<const re2::RE2>> patterns;
    // DEFAULT: host supplied.
    std::string label;
    Selector selector;

    static ThreadDumper all();
    static ThreadDumper specific(const std::vector<std::string>& thread_names);
    static ThreadDumper regex(const std::vector<std::string>& regexes);
    static ThreadDumper host_default(std::string label, Selector selector);

    // Threads to sample from the current snapshot. self_tid is the sampler's
    // own worker thread, never returned by ALL.
    std::vector<const ThreadSnapshot*> select(const std::vector<ThreadSnapshot>& snapshot, pid_t self_tid) const;

    bool matches(const ThreadSnapshot& thread, pid_t self_tid) const;

    std::string describe() const;
};
