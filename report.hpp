#pragma once

#include <stdint.h>
#include <optional>
#include <string>
#include <vector>

#include "sampler.hpp"

enum class ThreadOrder {
    BY_NAME,
    BY_TIME,
};

const char* to_string(ThreadOrder order);

struct Submitter {
    std::string name;
    std::string id;
};

struct ReportOptions {
    ThreadOrder order = ThreadOrder::BY_NAME;
    std::optional<std::string> comment;
    std::optional<Submitter> submitter;
    // Collapse direct self-recursion (a -> a) into a single node.
    bool merge_parent_calls = false;
};

struct ReportNode {
    std::string class_name;
    // Display name, disambiguated against other overloads in the same report.
    std::string method_name;
    std::string descriptor;
    uint32_t line = 0;
    bool native = false;
    uint64_t count = 0;
    double time_ms = 0;
    std::vector<ReportNode> children;
};

struct ReportThread {
    std::string name;
    uint64_t count = 0;
    double time_ms = 0;
    std::vector<ReportNode> children;
};

struct PlatformInfo {
    std::string os_name;
    std::string os_release;
    std::string hostname;
    int64_t pid = 0;
};

struct ReportMetadata {
    int64_t start_time_ms = 0;
    int64_t duration_ms = 0;
    double interval_ms = 0;
    ThreadOrder order = ThreadOrder::BY_NAME;
    std::optional<std::string> comment;
    std::optional<Submitter> submitter;
    bool merge_parent_calls = false;
    std::string backend;
    std::string thread_dumper;
    std::string thread_grouper;
    PlatformInfo platform;
};

struct Report {
    ReportMetadata metadata;
    std::vector<ReportThread> threads;

    uint64_t total_samples() const;
};

PlatformInfo current_platform_info();

// Builds a report from a stopped sampler. The sampler's data is only read, so
// any number of reports with different options may be built from it.
// Throws std::logic_error if the sampler is not STOPPED.
Report build_report(const Sampler& sampler, const ReportOptions& options);
