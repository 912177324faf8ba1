#include <gtest/gtest.h>

#include "thread_grouper.hpp"

TEST(ThreadGrouper, StripPoolSuffix) {
    EXPECT_EQ(strip_pool_suffix("Worker-12"), "Worker");
    EXPECT_EQ(strip_pool_suffix("Netty IO #3"), "Netty IO");
    EXPECT_EQ(strip_pool_suffix("pool-1-thread-4"), "pool-1-thread");
    EXPECT_EQ(strip_pool_suffix("main"), "main");
    EXPECT_EQ(strip_pool_suffix("1234"), "1234");
}

TEST(ThreadGrouper, Keys) {
    EXPECT_EQ(ThreadGrouper::by_name().group_key("Worker-12"), "Worker-12");
    EXPECT_EQ(ThreadGrouper::by_pool().group_key("Worker-12"), "Worker");
    EXPECT_EQ(ThreadGrouper::as_one().group_key("Worker-12"), ThreadGrouper::AS_ONE_KEY);
    EXPECT_EQ(ThreadGrouper::as_one().group_key("main"), "all");
}

TEST(ThreadGrouper, Describe) {
    EXPECT_EQ(ThreadGrouper::by_name().describe(), "by-name");
    EXPECT_EQ(ThreadGrouper::by_pool().describe(), "by-pool");
    EXPECT_EQ(ThreadGrouper::as_one().describe(), "as-one");
}
