#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "call_tree.hpp"
#include "fake_dump_source.hpp"

// leaf first, as unwinders report them
static std::vector<StackFrame> Stack(std::initializer_list<const char*> methods) {
    std::vector<StackFrame> frames;
    for (const char* method: methods) {
        frames.push_back(Frame("App", method));
    }
    return frames;
}

static FrameKey Key(const char* method) {
    return FrameKey { "App", method, "", 0 };
}

TEST(CallTree, IdenticalSamplesAccumulate) {
    CallTreeAggregator aggregator;
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(aggregator.record("main", Stack({"leaf", "mid", "root"}), 4));
    }

    auto tree = aggregator.copy_group("main");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(tree->count, 5u);
    EXPECT_DOUBLE_EQ(tree->time_ms, 20);
    EXPECT_EQ(tree->frame.method_name, "main");

    const CallTreeNode* root = tree->find(Key("root"));
    ASSERT_NE(root, nullptr);
    const CallTreeNode* mid = root->find(Key("mid"));
    ASSERT_NE(mid, nullptr);
    const CallTreeNode* leaf = mid->find(Key("leaf"));
    ASSERT_NE(leaf, nullptr);
    EXPECT_EQ(leaf->count, 5u);
    EXPECT_TRUE(leaf->children.empty());
    EXPECT_EQ(aggregator.total_samples(), 5u);
}

TEST(CallTree, DivergingPathsShareTheirPrefix) {
    CallTreeAggregator aggregator;
    aggregator.record("main", Stack({"c", "b", "a"}), 1);
    aggregator.record("main", Stack({"c", "d", "a"}), 1);

    auto tree = aggregator.copy_group("main");
    ASSERT_NE(tree, nullptr);
    ASSERT_EQ(tree->children.size(), 1u);
    const CallTreeNode* a = tree->find(Key("a"));
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->count, 2u);
    ASSERT_EQ(a->children.size(), 2u);
    EXPECT_EQ(a->find(Key("b"))->find(Key("c"))->count, 1u);
    EXPECT_EQ(a->find(Key("d"))->find(Key("c"))->count, 1u);
}

TEST(CallTree, RootFirstOrder) {
    CallTreeAggregator aggregator(StackOrder::ROOT_FIRST);
    aggregator.record("main", Stack({"a", "b"}), 1);
    auto tree = aggregator.copy_group("main");
    ASSERT_NE(tree->find(Key("a")), nullptr);
    EXPECT_NE(tree->find(Key("a"))->find(Key("b")), nullptr);
}

TEST(CallTree, LinesAreDistinctFrames) {
    CallTreeAggregator aggregator;
    auto first = Stack({"a"});
    auto second = Stack({"a"});
    second[0].line = 7;
    aggregator.record("main", first, 1);
    aggregator.record("main", second, 1);
    EXPECT_EQ(aggregator.copy_group("main")->children.size(), 2u);
}

TEST(CallTree, EmptyStackCountsOnGroupOnly) {
    CallTreeAggregator aggregator;
    aggregator.record("idle", {}, 4);
    auto tree = aggregator.copy_group("idle");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(tree->count, 1u);
    EXPECT_TRUE(tree->children.empty());
}

TEST(CallTree, FrozenRejectsRecords) {
    CallTreeAggregator aggregator;
    aggregator.record("main", Stack({"a"}), 1);
    aggregator.freeze();

    EXPECT_TRUE(aggregator.is_frozen());
    EXPECT_FALSE(aggregator.record("main", Stack({"a"}), 1));
    EXPECT_FALSE(aggregator.record("other", Stack({"a"}), 1));
    EXPECT_EQ(aggregator.total_samples(), 1u);
    EXPECT_EQ(aggregator.groups(), std::vector<std::string>{"main"});
}

TEST(CallTree, DiscardDropsEverything) {
    CallTreeAggregator aggregator;
    aggregator.record("main", Stack({"a"}), 1);
    aggregator.discard();

    EXPECT_TRUE(aggregator.is_frozen());
    EXPECT_EQ(aggregator.total_samples(), 0u);
    EXPECT_EQ(aggregator.copy_group("main"), nullptr);
}

TEST(CallTree, ConcurrentWritersLoseNothing) {
    CallTreeAggregator aggregator;
    const int writers = 4;
    const int per_writer = 2000;

    std::vector<std::thread> threads;
    for (int w = 0; w < writers; ++w) {
        threads.emplace_back([&aggregator, w] {
            std::string group = w % 2 == 0 ? "even" : "odd";
            for (int i = 0; i < per_writer; ++i) {
                aggregator.record(group, Stack({"leaf", "root"}), 1);
            }
        });
    }
    for (auto& thread: threads) {
        thread.join();
    }

    EXPECT_EQ(aggregator.total_samples(), (uint64_t) writers * per_writer);
    EXPECT_EQ(aggregator.copy_group("even")->find(Key("root"))->count, (uint64_t) 2 * per_writer);
}
