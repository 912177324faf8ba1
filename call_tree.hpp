#pragma once

#include <stdint.h>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "thread_dump.hpp"

// Identity of a frame within a call tree. Children of a node are unique by key.
struct FrameKey {
    std::string class_name;
    std::string method_name;
    std::string descriptor;
    uint32_t line = 0;

    static FrameKey of(const StackFrame& frame) {
        return FrameKey { frame.class_name, frame.method_name, frame.descriptor, frame.line };
    }

    bool operator<(const FrameKey& other) const;
    bool operator==(const FrameKey& other) const;
    bool operator!=(const FrameKey& other) const { return !(*this == other); }
};

struct CallTreeNode {
    FrameKey frame;
    bool native = false;
    uint64_t count = 0;
    double time_ms = 0;
    std::map<FrameKey, std::unique_ptr<CallTreeNode>> children;

    CallTreeNode() = default;
    explicit CallTreeNode(FrameKey frame, bool native = false) : frame(std::move(frame)), native(native) {}

    CallTreeNode& child(const StackFrame& frame);

    const CallTreeNode* find(const FrameKey& key) const;

    std::unique_ptr<CallTreeNode> clone() const;
};

enum class StackOrder {
    // frames[0] is the innermost call, as unwinders report them
    LEAF_FIRST,
    ROOT_FIRST,
};

// Per-group call trees. Writers lock only the group they touch; freeze() waits
// for in-flight writes and rejects every later one.
class CallTreeAggregator {
public:
    using Visitor = std::function<void(const std::string& group, const CallTreeNode& root)>;

    explicit CallTreeAggregator(StackOrder order = StackOrder::LEAF_FIRST) : order(order) {}
    CallTreeAggregator(const CallTreeAggregator&) = delete;
    CallTreeAggregator& operator=(const CallTreeAggregator&) = delete;

    // Adds one sample along the path of frames. Returns false once frozen.
    bool record(const std::string& group, const std::vector<StackFrame>& frames, double weight_ms);

    void freeze();

    // Drops all recorded data and freezes.
    void discard();

    bool is_frozen() const {
        return frozen.load(std::memory_order_acquire);
    }

    std::vector<std::string> groups() const;

    uint64_t total_samples() const;

    // Visits every group root, each under its own group lock.
    void visit(const Visitor& visitor) const;

    // Deep copy of one group, or nullptr when the group was never recorded.
    std::unique_ptr<CallTreeNode> copy_group(const std::string& group) const;

private:
    struct GroupTree {
        std::mutex mutex;
        CallTreeNode root;
    };

    StackOrder order;
    mutable std::shared_mutex groups_mutex;
    std::unordered_map<std::string, std::unique_ptr<GroupTree>> trees;
    std::atomic<bool> frozen { false };

    void append(CallTreeNode& root, const std::vector<StackFrame>& frames, double weight_ms) const;
};
