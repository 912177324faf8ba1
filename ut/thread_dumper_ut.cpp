#include <gtest/gtest.h>

#include "fake_dump_source.hpp"
#include "thread_dumper.hpp"

static std::vector<ThreadSnapshot> Threads() {
    return {
        Thread(100, "main", {}),
        Thread(101, "Worker-1", {}),
        Thread(102, "Worker-2", {}),
        Thread(103, "Netty IO #1", {}),
        Thread(104, "stackprof-sampler", {}),
    };
}

static std::vector<pid_t> Tids(const std::vector<const ThreadSnapshot*>& selected) {
    std::vector<pid_t> result;
    for (const ThreadSnapshot* thread: selected) {
        result.push_back(thread->tid);
    }
    return result;
}

TEST(ThreadDumper, AllExcludesSamplerThread) {
    auto threads = Threads();
    auto selected = ThreadDumper::all().select(threads, 104);
    EXPECT_EQ(Tids(selected), (std::vector<pid_t>{100, 101, 102, 103}));
}

TEST(ThreadDumper, SpecificIsCaseInsensitive) {
    auto threads = Threads();
    auto dumper = ThreadDumper::specific({"MAIN", "worker-2"});
    EXPECT_EQ(Tids(dumper.select(threads, 0)), (std::vector<pid_t>{100, 102}));
    EXPECT_EQ(dumper.kind, ThreadDumper::Kind::SPECIFIC);
}

TEST(ThreadDumper, SpecificNeedsExactName) {
    auto threads = Threads();
    auto dumper = ThreadDumper::specific({"Worker"});
    EXPECT_TRUE(dumper.select(threads, 0).empty());
}

TEST(ThreadDumper, RegexMatchesWholeName) {
    auto threads = Threads();
    auto dumper = ThreadDumper::regex({"worker-\\d+"});
    EXPECT_EQ(Tids(dumper.select(threads, 0)), (std::vector<pid_t>{101, 102}));

    auto partial = ThreadDumper::regex({"work"});
    EXPECT_TRUE(partial.select(threads, 0).empty());
}

TEST(ThreadDumper, InvalidRegexIsSkipped) {
    auto threads = Threads();
    auto dumper = ThreadDumper::regex({"(unclosed", "main"});
    EXPECT_EQ(dumper.patterns.size(), 1u);
    EXPECT_EQ(Tids(dumper.select(threads, 0)), (std::vector<pid_t>{100}));
}

TEST(ThreadDumper, HostDefaultUsesSelector) {
    auto threads = Threads();
    auto dumper = ThreadDumper::host_default("main thread", [](const ThreadSnapshot& thread) {
        return thread.tid == 100;
    });
    EXPECT_EQ(Tids(dumper.select(threads, 0)), (std::vector<pid_t>{100}));
    EXPECT_NE(dumper.describe().find("main thread"), std::string::npos);
}
