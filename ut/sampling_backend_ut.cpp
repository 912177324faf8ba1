#include <atomic>
#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "completion.hpp"
#include "sampling_backend.hpp"

using namespace std::chrono_literals;

static void RunUntilTicks(SamplingBackend& backend, int ticks) {
    std::atomic<int> seen { 0 };
    Status status = backend.run(1ms, [&seen, ticks] {
        return ++seen < ticks;
    });
    EXPECT_TRUE(status.isOk());
    EXPECT_EQ(seen.load(), ticks);
}

static void HaltFromOtherThread(SamplingBackend& backend) {
    std::atomic<int> seen { 0 };
    std::thread runner([&backend, &seen] {
        Status status = backend.run(1ms, [&seen] {
            ++seen;
            return true;
        });
        EXPECT_TRUE(status.isOk());
    });
    while (seen.load() < 3) {
        std::this_thread::sleep_for(1ms);
    }
    backend.halt();
    runner.join();
}

TEST(FallbackBackend, TicksUntilFalse) {
    FallbackBackend backend;
    EXPECT_STREQ(backend.name(), "fallback");
    RunUntilTicks(backend, 5);
}

TEST(FallbackBackend, Halt) {
    FallbackBackend backend;
    HaltFromOtherThread(backend);
}

TEST(TimerfdBackend, TicksUntilFalse) {
    auto backend = TimerfdBackend::create();
    ASSERT_TRUE(backend.isOk()) << backend.getErrRef();
    EXPECT_STREQ(backend.getOkRef()->name(), "native");
    RunUntilTicks(*backend.getOkRef(), 5);
}

TEST(TimerfdBackend, Halt) {
    auto backend = TimerfdBackend::create();
    ASSERT_TRUE(backend.isOk()) << backend.getErrRef();
    HaltFromOtherThread(*backend.getOkRef());
}

TEST(SamplingBackend, ForcedFallback) {
    EXPECT_STREQ(make_sampling_backend(true, false)->name(), "fallback");
}

TEST(Completion, FirstResolveWins) {
    Completion completion;
    int calls = 0;
    completion.on_complete([&calls](const CompletionResult& result) {
        ++calls;
        EXPECT_EQ(result.outcome, CompletionOutcome::FAILED);
        EXPECT_EQ(result.error, "boom");
    });
    EXPECT_FALSE(completion.wait_for(1ms).has_value());

    EXPECT_TRUE(completion.resolve(CompletionOutcome::FAILED, "boom"));
    EXPECT_FALSE(completion.resolve(CompletionOutcome::SUCCESS));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(completion.wait().outcome, CompletionOutcome::FAILED);

    // late subscribers run immediately
    completion.on_complete([&calls](const CompletionResult&) { ++calls; });
    EXPECT_EQ(calls, 2);
}
