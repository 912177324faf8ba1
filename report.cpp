#include <algorithm>
#include <stdexcept>
#include <tuple>
#include <utility>

#include <limits.h>
#include <unistd.h>
#include <sys/utsname.h>

#include "method_disambiguator.hpp"
#include "report.hpp"

using std::string;
using std::vector;
using std::move;

const char* to_string(ThreadOrder order) {
    switch (order) {
        case ThreadOrder::BY_NAME:
            return "by-name";
        case ThreadOrder::BY_TIME:
            return "by-time";
    }
    return "unknown";
}

uint64_t Report::total_samples() const {
    uint64_t total = 0;
    for (const auto& thread: threads) {
        total += thread.count;
    }
    return total;
}

PlatformInfo current_platform_info() {
    PlatformInfo info;
    struct utsname name;
    if (uname(&name) == 0) {
        info.os_name = name.sysname;
        info.os_release = name.release;
    }
    char hostname[HOST_NAME_MAX + 1] = {};
    if (gethostname(hostname, sizeof(hostname) - 1) == 0) {
        info.hostname = hostname;
    }
    info.pid = getpid();
    return info;
}

static bool same_method(const ReportNode& a, const ReportNode& b) {
    return a.method_name == b.method_name && a.class_name == b.class_name && a.descriptor == b.descriptor;
}

static bool same_frame(const ReportNode& a, const ReportNode& b) {
    return a.line == b.line && same_method(a, b);
}

static void merge_into(vector<ReportNode>& siblings, ReportNode&& incoming) {
    for (auto& sibling: siblings) {
        if (same_frame(sibling, incoming)) {
            sibling.count += incoming.count;
            sibling.time_ms += incoming.time_ms;
            for (auto& child: incoming.children) {
                merge_into(sibling.children, move(child));
            }
            return;
        }
    }
    siblings.push_back(move(incoming));
}

// a -> a -> b becomes a -> b, with the inner a's totals added to the outer one.
static void collapse_recursion(ReportNode& node) {
    bool collapsed = true;
    while (collapsed) {
        collapsed = false;
        for (size_t i = 0; i < node.children.size(); ++i) {
            if (!same_method(node.children[i], node)) {
                continue;
            }
            ReportNode inner = move(node.children[i]);
            node.children.erase(node.children.begin() + i);
            node.count += inner.count;
            node.time_ms += inner.time_ms;
            for (auto& grandchild: inner.children) {
                merge_into(node.children, move(grandchild));
            }
            collapsed = true;
            break;
        }
    }
    for (auto& child: node.children) {
        collapse_recursion(child);
    }
}

static void observe_methods(const CallTreeNode& node, MethodDisambiguator& disambiguator) {
    for (const auto& entry: node.children) {
        const FrameKey& key = entry.first;
        disambiguator.observe(key.class_name, key.method_name, key.descriptor);
        observe_methods(*entry.second, disambiguator);
    }
}

static ReportNode convert(const CallTreeNode& node) {
    ReportNode result;
    result.class_name = node.frame.class_name;
    result.method_name = node.frame.method_name;
    result.descriptor = node.frame.descriptor;
    result.line = node.frame.line;
    result.native = node.native;
    result.count = node.count;
    result.time_ms = node.time_ms;
    result.children.reserve(node.children.size());
    for (const auto& entry: node.children) {
        result.children.push_back(convert(*entry.second));
    }
    return result;
}

static void render_names(ReportNode& node, MethodDisambiguator& disambiguator) {
    node.method_name = disambiguator.disambiguate(node.class_name, node.method_name, node.descriptor);
    for (auto& child: node.children) {
        render_names(child, disambiguator);
    }
}

static bool time_order(const ReportNode& a, const ReportNode& b) {
    if (a.time_ms != b.time_ms) {
        return a.time_ms > b.time_ms;
    }
    if (a.count != b.count) {
        return a.count > b.count;
    }
    return std::tie(a.class_name, a.method_name, a.line) < std::tie(b.class_name, b.method_name, b.line);
}

static bool name_order(const ReportNode& a, const ReportNode& b) {
    return std::tie(a.class_name, a.method_name, a.line) < std::tie(b.class_name, b.method_name, b.line);
}

static void sort_children(vector<ReportNode>& nodes, ThreadOrder order) {
    std::sort(nodes.begin(), nodes.end(), order == ThreadOrder::BY_TIME ? time_order : name_order);
    for (auto& node: nodes) {
        sort_children(node.children, order);
    }
}

Report build_report(const Sampler& sampler, const ReportOptions& options) {
    if (sampler.state() != SamplerState::STOPPED || !sampler.data().is_frozen()) {
        throw std::logic_error(string("Cannot build a report from a sampler in state ") + to_string(sampler.state()));
    }

    Report report;
    ReportMetadata& metadata = report.metadata;
    metadata.start_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        sampler.start_time().time_since_epoch()).count();
    auto end = sampler.end_time();
    if (end.has_value()) {
        metadata.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(*end - sampler.start_time()).count();
    }
    metadata.interval_ms = sampler.config().interval_ms();
    metadata.order = options.order;
    metadata.comment = options.comment;
    metadata.submitter = options.submitter;
    metadata.merge_parent_calls = options.merge_parent_calls;
    metadata.backend = sampler.backend_name();
    metadata.thread_dumper = sampler.config().dumper.describe();
    metadata.thread_grouper = sampler.config().grouper.describe();
    metadata.platform = current_platform_info();

    MethodDisambiguator disambiguator;
    sampler.data().visit([&](const string& group, const CallTreeNode& root) {
        observe_methods(root, disambiguator);

        ReportThread thread;
        thread.name = group;
        thread.count = root.count;
        thread.time_ms = root.time_ms;
        for (const auto& entry: root.children) {
            thread.children.push_back(convert(*entry.second));
        }
        report.threads.push_back(move(thread));
    });

    for (auto& thread: report.threads) {
        if (options.merge_parent_calls) {
            for (auto& child: thread.children) {
                collapse_recursion(child);
            }
        }
        for (auto& child: thread.children) {
            render_names(child, disambiguator);
        }
        sort_children(thread.children, options.order);
    }

    if (options.order == ThreadOrder::BY_TIME) {
        std::sort(report.threads.begin(), report.threads.end(), [](const ReportThread& a, const ReportThread& b) {
            if (a.time_ms != b.time_ms) {
                return a.time_ms > b.time_ms;
            }
            return a.name < b.name;
        });
    } else {
        std::sort(report.threads.begin(), report.threads.end(), [](const ReportThread& a, const ReportThread& b) {
            return a.name < b.name;
        });
    }

    return report;
}
