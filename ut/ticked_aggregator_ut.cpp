#include <gtest/gtest.h>

#include "fake_dump_source.hpp"
#include "ticked_aggregator.hpp"

using namespace std::chrono_literals;

TEST(TickedAggregator, ShortTicksAreDropped) {
    CallTreeAggregator tree;
    TickedAggregator ticked(tree, 50ms);
    auto t0 = TickedAggregator::Clock::now();

    ticked.begin(t0);
    ticked.record("main", {Frame("App", "fast")}, 4);
    ticked.on_tick(t0 + 10ms);

    ticked.record("main", {Frame("App", "slow")}, 4);
    ticked.record("main", {Frame("App", "slow")}, 4);
    ticked.on_tick(t0 + 80ms);

    EXPECT_EQ(ticked.committed_ticks(), 1u);
    EXPECT_EQ(ticked.dropped_ticks(), 1u);
    EXPECT_EQ(tree.total_samples(), 2u);

    auto main = tree.copy_group("main");
    ASSERT_NE(main, nullptr);
    EXPECT_EQ(main->find(FrameKey { "App", "fast", "", 0 }), nullptr);
    EXPECT_NE(main->find(FrameKey { "App", "slow", "", 0 }), nullptr);
}

TEST(TickedAggregator, CompleteClosesFinalTick) {
    CallTreeAggregator tree;
    TickedAggregator ticked(tree, 5ms);
    auto t0 = TickedAggregator::Clock::now();

    ticked.begin(t0);
    ticked.record("main", {Frame("App", "run")}, 4);
    ticked.complete(t0 + 20ms);
    EXPECT_EQ(tree.total_samples(), 1u);

    ticked.record("main", {Frame("App", "run")}, 4);
    ticked.on_tick(t0 + 40ms);
    EXPECT_EQ(tree.total_samples(), 1u);
    EXPECT_EQ(ticked.committed_ticks(), 1u);
}

TEST(TickedAggregator, DiscardDropsPending) {
    CallTreeAggregator tree;
    TickedAggregator ticked(tree, 0ms);
    auto t0 = TickedAggregator::Clock::now();

    ticked.begin(t0);
    ticked.record("main", {Frame("App", "run")}, 4);
    ticked.discard();
    ticked.complete(t0 + 10ms);
    EXPECT_EQ(tree.total_samples(), 0u);
}
