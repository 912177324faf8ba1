#include <iostream>
#include <algorithm>
#include <cctype>
#include <utility>

#include <re2/re2.h>

#include "thread_dumper.hpp"

using std::string;
using std::vector;
using std::move;

static string to_lower(string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
    return value;
}

ThreadDumper ThreadDumper::all() {
    ThreadDumper dumper;
    dumper.kind = Kind::ALL;
    return dumper;
}

ThreadDumper ThreadDumper::specific(const vector<string>& thread_names) {
    ThreadDumper dumper;
    dumper.kind = Kind::SPECIFIC;
    for (const auto& name: thread_names) {
        dumper.names.push_back(to_lower(name));
    }
    return dumper;
}

ThreadDumper ThreadDumper::regex(const vector<string>& regexes) {
    ThreadDumper dumper;
    dumper.kind = Kind::REGEX;

    re2::RE2::Options options;
    options.set_case_sensitive(false);
    options.set_log_errors(false);

    for (const auto& source: regexes) {
        auto pattern = std::make_shared<const re2::RE2>(source, options);
        if (!pattern->ok()) {
            std::cerr << "Invalid thread regex '" << source << "': " << pattern->error() << "\n";
            continue;
        }
        dumper.names.push_back(source);
        dumper.patterns.push_back(move(pattern));
    }
    return dumper;
}

ThreadDumper ThreadDumper::host_default(string label, Selector selector) {
    ThreadDumper dumper;
    dumper.kind = Kind::DEFAULT;
    dumper.label = move(label);
    dumper.selector = move(selector);
    return dumper;
}

bool ThreadDumper::matches(const ThreadSnapshot& thread, pid_t self_tid) const {
    switch (kind) {
        case Kind::ALL:
            return thread.tid != self_tid;
        case Kind::SPECIFIC: {
            // names that resolve to no live thread are simply never matched
            string lowered = to_lower(thread.name);
            return std::find(names.begin(), names.end(), lowered) != names.end();
        }
        case Kind::REGEX:
            for (const auto& pattern: patterns) {
                if (re2::RE2::FullMatch(thread.name, *pattern)) {
                    return true;
                }
            }
            return false;
        case Kind::DEFAULT:
            return selector && selector(thread);
    }
    return false;
}

vector<const ThreadSnapshot*> ThreadDumper::select(const vector<ThreadSnapshot>& snapshot, pid_t self_tid) const {
    vector<const ThreadSnapshot*> selected;
    for (const auto& thread: snapshot) {
        if (matches(thread, self_tid)) {
            selected.push_back(&thread);
        }
    }
    return selected;
}

static string join(const vector<string>& values) {
    string result;
    for (const auto& value: values) {
        if (!result.empty()) {
            result += ", ";
        }
        result += value;
    }
    return result;
}

string ThreadDumper::describe() const {
    switch (kind) {
        case Kind::ALL:
            return "all";
        case Kind::SPECIFIC:
            return "specific [" + join(names) + "]";
        case Kind::REGEX:
            return "regex [" + join(names) + "]";
        case Kind::DEFAULT:
            return label;
    }
    return "unknown";
}
