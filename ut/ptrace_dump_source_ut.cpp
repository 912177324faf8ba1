#include <algorithm>

#include <unistd.h>
#include <sys/syscall.h>

#include <gtest/gtest.h>

#include "ptrace_dump_source.hpp"

TEST(ProcThreads, ListsOwnThreads) {
    auto threads = list_threads(getpid());
    ASSERT_TRUE(threads.isOk()) << threads.getErrRef();
    const auto& tids = threads.getOkRef();
    pid_t self = (pid_t) syscall(SYS_gettid);
    EXPECT_NE(std::find(tids.begin(), tids.end(), self), tids.end());
}

TEST(ProcThreads, MissingProcessIsEmpty) {
    // above the default pid_max
    auto threads = list_threads(4194304 + 1);
    ASSERT_TRUE(threads.isOk());
    EXPECT_TRUE(threads.getOkRef().empty());
}

TEST(ProcThreads, ReadsOwnStatus) {
    auto status = read_thread_status((pid_t) syscall(SYS_gettid));
    ASSERT_TRUE(status.has_value());
    EXPECT_FALSE(status->name.empty());
    EXPECT_EQ(status->state, 'R');
    EXPECT_FALSE(read_thread_status(4194304 + 1).has_value());
}
