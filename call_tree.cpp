#include <tuple>
#include <utility>

#include "call_tree.hpp"

using std::string;
using std::vector;
using std::unique_ptr;

bool FrameKey::operator<(const FrameKey& other) const {
    return std::tie(class_name, method_name, descriptor, line) <
        std::tie(other.class_name, other.method_name, other.descriptor, other.line);
}

bool FrameKey::operator==(const FrameKey& other) const {
    return line == other.line &&
        method_name == other.method_name &&
        class_name == other.class_name &&
        descriptor == other.descriptor;
}

CallTreeNode& CallTreeNode::child(const StackFrame& frame) {
    FrameKey key = FrameKey::of(frame);
    auto it = children.find(key);
    if (it == children.end()) {
        auto node = std::make_unique<CallTreeNode>(key, frame.native);
        it = children.emplace(std::move(key), std::move(node)).first;
    }
    return *it->second;
}

const CallTreeNode* CallTreeNode::find(const FrameKey& key) const {
    auto it = children.find(key);
    return it == children.end() ? nullptr : it->second.get();
}

unique_ptr<CallTreeNode> CallTreeNode::clone() const {
    auto copy = std::make_unique<CallTreeNode>(frame, native);
    copy->count = count;
    copy->time_ms = time_ms;
    for (const auto& entry: children) {
        copy->children.emplace(entry.first, entry.second->clone());
    }
    return copy;
}

void CallTreeAggregator::append(CallTreeNode& root, const vector<StackFrame>& frames, double weight_ms) const {
    root.count += 1;
    root.time_ms += weight_ms;

    CallTreeNode* node = &root;
    auto visit_frame = [&](const StackFrame& frame) {
        node = &node->child(frame);
        node->count += 1;
        node->time_ms += weight_ms;
    };

    if (order == StackOrder::LEAF_FIRST) {
        for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
            visit_frame(*it);
        }
    } else {
        for (const auto& frame: frames) {
            visit_frame(frame);
        }
    }
}

bool CallTreeAggregator::record(const string& group, const vector<StackFrame>& frames, double weight_ms) {
    if (is_frozen()) {
        return false;
    }

    std::shared_lock<std::shared_mutex> shared_lock(groups_mutex);
    if (is_frozen()) {
        return false;
    }

    auto it = trees.find(group);
    if (it == trees.end()) {
        shared_lock.unlock();
        {
            std::unique_lock<std::shared_mutex> unique_lock(groups_mutex);
            if (is_frozen()) {
                return false;
            }
            auto& slot = trees[group];
            if (!slot) {
                slot = std::make_unique<GroupTree>();
                slot->root.frame.method_name = group;
            }
        }
        shared_lock.lock();
        // freeze() or discard() may have run while the lock was released
        if (is_frozen()) {
            return false;
        }
        it = trees.find(group);
    }

    GroupTree& tree = *it->second;
    std::lock_guard<std::mutex> tree_lock(tree.mutex);
    append(tree.root, frames, weight_ms);
    return true;
}

void CallTreeAggregator::freeze() {
    // taking the exclusive lock waits out every record() in flight
    std::unique_lock<std::shared_mutex> unique_lock(groups_mutex);
    frozen.store(true, std::memory_order_release);
}

void CallTreeAggregator::discard() {
    std::unique_lock<std::shared_mutex> unique_lock(groups_mutex);
    frozen.store(true, std::memory_order_release);
    trees.clear();
}

vector<string> CallTreeAggregator::groups() const {
    std::shared_lock<std::shared_mutex> shared_lock(groups_mutex);
    vector<string> names;
    names.reserve(trees.size());
    for (const auto& entry: trees) {
        names.push_back(entry.first);
    }
    return names;
}

uint64_t CallTreeAggregator::total_samples() const {
    uint64_t total = 0;
    visit([&](const string&, const CallTreeNode& root) {
        total += root.count;
    });
    return total;
}

void CallTreeAggregator::visit(const Visitor& visitor) const {
    std::shared_lock<std::shared_mutex> shared_lock(groups_mutex);
    for (const auto& entry: trees) {
        std::lock_guard<std::mutex> tree_lock(entry.second->mutex);
        visitor(entry.first, entry.second->root);
    }
}

unique_ptr<CallTreeNode> CallTreeAggregator::copy_group(const string& group) const {
    std::shared_lock<std::shared_mutex> shared_lock(groups_mutex);
    auto it = trees.find(group);
    if (it == trees.end()) {
        return nullptr;
    }
    std::lock_guard<std::mutex> tree_lock(it->second->mutex);
    return it->second->root.clone();
}
