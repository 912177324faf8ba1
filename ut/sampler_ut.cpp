#include <algorithm>
#include <chrono>
#include <limits>
#include <memory>
#include <thread>

#include <gtest/gtest.h>

#include "fake_dump_source.hpp"
#include "sampler.hpp"

using namespace std::chrono_literals;

static std::vector<ThreadSnapshot> Workload() {
    return {
        Thread(200, "main", {Frame("App", "compute"), Frame("App", "main")}),
        Thread(201, "Worker-1", {Frame("Pool", "take"), Frame("Pool", "run")}, 'S'),
        Thread(202, "Worker-2", {Frame("libc", "epoll_wait", "", true), Frame("Pool", "run")}),
    };
}

static SamplerConfig Config(SamplerConfigBuilder& builder) {
    auto config = builder.build();
    EXPECT_TRUE(config.isOk());
    return std::move(config).getOkRef();
}

static std::shared_ptr<Sampler> MakeSampler(SamplerConfigBuilder& builder, ThreadDumpSource& source, TickHook* hook = nullptr) {
    return std::make_shared<Sampler>(Config(builder), source, hook);
}

TEST(SamplerConfigBuilder, Validates) {
    EXPECT_FALSE(SamplerConfigBuilder().sampling_interval(0).build().isOk());
    EXPECT_FALSE(SamplerConfigBuilder().sampling_interval(-1).build().isOk());
    EXPECT_FALSE(SamplerConfigBuilder().complete_after(0ms).build().isOk());
    EXPECT_FALSE(SamplerConfigBuilder().minimum_tick_duration(-1ms).build().isOk());
    EXPECT_FALSE(SamplerConfigBuilder().sampling_interval(std::numeric_limits<double>::infinity()).build().isOk());
    EXPECT_FALSE(SamplerConfigBuilder().sampling_interval(std::numeric_limits<double>::quiet_NaN()).build().isOk());
    EXPECT_FALSE(SamplerConfigBuilder().sampling_interval(1e300).build().isOk());
    EXPECT_FALSE(SamplerConfigBuilder().sampling_interval(SamplerConfigBuilder::MAX_SAMPLING_INTERVAL_MS + 1).build().isOk());

    auto longest = SamplerConfigBuilder().sampling_interval(SamplerConfigBuilder::MAX_SAMPLING_INTERVAL_MS).build();
    ASSERT_TRUE(longest.isOk());
    EXPECT_EQ(longest.getOkRef().interval, std::chrono::hours(1));

    auto config = SamplerConfigBuilder().sampling_interval(0.5).complete_after(10s).build();
    ASSERT_TRUE(config.isOk());
    EXPECT_EQ(config.getOkRef().interval, 500us);
    ASSERT_TRUE(config.getOkRef().auto_end_time.has_value());
    EXPECT_GT(*config.getOkRef().auto_end_time, std::chrono::system_clock::now());
}

TEST(Sampler, StopFreezesData) {
    FakeDumpSource source(Workload());
    SamplerConfigBuilder builder;
    builder.dumper(ThreadDumper::all()).sampling_interval(1);
    auto sampler = MakeSampler(builder, source);

    EXPECT_EQ(sampler->state(), SamplerState::CREATED);
    sampler->start();
    EXPECT_TRUE(sampler->is_running());
    EXPECT_FALSE(sampler->backend_name().empty());

    std::this_thread::sleep_for(100ms);
    EXPECT_TRUE(sampler->stop());
    EXPECT_FALSE(sampler->stop());
    EXPECT_FALSE(sampler->cancel());

    EXPECT_EQ(sampler->state(), SamplerState::STOPPED);
    EXPECT_FALSE(sampler->timed_out());
    EXPECT_TRUE(sampler->data().is_frozen());
    EXPECT_TRUE(sampler->end_time().has_value());

    auto result = sampler->completion().peek();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->outcome, CompletionOutcome::SUCCESS);

    uint64_t samples = sampler->total_samples();
    EXPECT_GT(samples, 0u);
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(sampler->total_samples(), samples);
}

TEST(Sampler, StartTwiceThrows) {
    FakeDumpSource source(Workload());
    SamplerConfigBuilder builder;
    auto sampler = MakeSampler(builder, source);
    sampler->start();
    EXPECT_THROW(sampler->start(), std::logic_error);
    sampler->stop();
}

TEST(Sampler, TimeoutStopsItself) {
    FakeDumpSource source(Workload());
    SamplerConfigBuilder builder;
    builder.dumper(ThreadDumper::all()).sampling_interval(2).complete_after(150ms);
    auto sampler = MakeSampler(builder, source);
    sampler->start();

    auto result = sampler->completion().wait_for(10s);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->outcome, CompletionOutcome::SUCCESS);
    EXPECT_EQ(sampler->state(), SamplerState::STOPPED);
    EXPECT_TRUE(sampler->timed_out());
    EXPECT_GT(sampler->total_samples(), 0u);
    EXPECT_GE(*sampler->end_time(), *sampler->auto_end_time() - 1ms);
}

TEST(Sampler, CancelDiscardsData) {
    FakeDumpSource source(Workload());
    SamplerConfigBuilder builder;
    builder.dumper(ThreadDumper::all()).sampling_interval(1);
    auto sampler = MakeSampler(builder, source);
    sampler->start();
    std::this_thread::sleep_for(50ms);

    EXPECT_TRUE(sampler->cancel());
    EXPECT_EQ(sampler->state(), SamplerState::CANCELLED);
    EXPECT_EQ(sampler->completion().wait().outcome, CompletionOutcome::CANCELLED);
    EXPECT_EQ(sampler->total_samples(), 0u);
    EXPECT_FALSE(sampler->stop());
}

TEST(Sampler, CancelBeforeStart) {
    FakeDumpSource source(Workload());
    SamplerConfigBuilder builder;
    auto sampler = MakeSampler(builder, source);
    EXPECT_TRUE(sampler->cancel());
    EXPECT_EQ(sampler->state(), SamplerState::CANCELLED);
    EXPECT_THROW(sampler->start(), std::logic_error);
}

TEST(Sampler, FailedDumpsSkipTicks) {
    FakeDumpSource source(Workload());
    source.failing = true;
    SamplerConfigBuilder builder;
    builder.dumper(ThreadDumper::all()).sampling_interval(1);
    auto sampler = MakeSampler(builder, source);
    sampler->start();
    std::this_thread::sleep_for(50ms);

    EXPECT_TRUE(sampler->is_running());
    EXPECT_TRUE(sampler->stop());
    EXPECT_GT(source.dumps.load(), 0u);
    EXPECT_EQ(sampler->total_samples(), 0u);
}

TEST(Sampler, CaptureErrorFailsSession) {
    ThrowingDumpSource source;
    SamplerConfigBuilder builder;
    builder.sampling_interval(1);
    auto sampler = MakeSampler(builder, source);
    sampler->start();

    auto result = sampler->completion().wait_for(10s);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->outcome, CompletionOutcome::FAILED);
    EXPECT_EQ(result->error, "unwinder crashed");
    EXPECT_EQ(sampler->state(), SamplerState::FAILED);
    EXPECT_FALSE(sampler->stop());
}

TEST(Sampler, GroupsAndFilters) {
    FakeDumpSource source(Workload());
    SamplerConfigBuilder builder;
    builder.dumper(ThreadDumper::all()).grouper(ThreadGrouper::by_pool()).sampling_interval(1);
    auto sampler = MakeSampler(builder, source);
    sampler->start();
    std::this_thread::sleep_for(50ms);
    sampler->stop();

    auto groups = sampler->data().groups();
    std::sort(groups.begin(), groups.end());
    EXPECT_EQ(groups, (std::vector<std::string>{"Worker", "main"}));

    auto workers = sampler->data().copy_group("Worker");
    auto main = sampler->data().copy_group("main");
    ASSERT_NE(workers, nullptr);
    ASSERT_NE(main, nullptr);
    EXPECT_EQ(workers->count, 2 * main->count);

    FakeDumpSource filtered_source(Workload());
    SamplerConfigBuilder filtered_builder;
    filtered_builder.dumper(ThreadDumper::all())
        .grouper(ThreadGrouper::by_name())
        .ignore_sleeping(true)
        .ignore_native(true)
        .sampling_interval(1);
    auto filtered = MakeSampler(filtered_builder, filtered_source);
    filtered->start();
    std::this_thread::sleep_for(50ms);
    filtered->stop();

    EXPECT_EQ(filtered->data().groups(), std::vector<std::string>{"main"});
}

TEST(Sampler, ForcedFallbackBackend) {
    FakeDumpSource source(Workload());
    SamplerConfigBuilder builder;
    builder.force_fallback_backend(true).sampling_interval(1);
    auto sampler = MakeSampler(builder, source);
    sampler->start();
    EXPECT_EQ(sampler->backend_name(), "fallback");
    std::this_thread::sleep_for(20ms);
    sampler->stop();
}

TEST(Sampler, SampleRateFollowsInterval) {
    FakeDumpSource source({Thread(200, "main", {Frame("App", "main")})});
    SamplerConfigBuilder builder;
    builder.dumper(ThreadDumper::specific({"main"})).sampling_interval(4);
    auto sampler = MakeSampler(builder, source);

    sampler->start();
    std::this_thread::sleep_for(1000ms);
    sampler->stop();

    // ~250 expected; scheduling jitter only ever loses ticks
    EXPECT_GE(sampler->total_samples(), 100u);
    EXPECT_LE(sampler->total_samples(), 260u);

    auto main = sampler->data().copy_group("main");
    ASSERT_NE(main, nullptr);
    EXPECT_DOUBLE_EQ(main->time_ms, main->count * 4.0);
}

TEST(Sampler, TickedModeKeepsOnlyLongTicks) {
    FakeDumpSource source(Workload());
    TickHook hook;
    SamplerConfigBuilder builder;
    builder.dumper(ThreadDumper::all()).sampling_interval(1).minimum_tick_duration(std::chrono::hours(1));
    auto sampler = MakeSampler(builder, source, &hook);
    sampler->start();

    for (int i = 0; i < 5; ++i) {
        std::this_thread::sleep_for(10ms);
        hook.on_tick();
    }
    sampler->stop();

    EXPECT_GT(sampler->tick_count(), 0u);
    EXPECT_EQ(sampler->total_samples(), 0u);
}

TEST(Sampler, TickedModeCommitsAtTickBoundaries) {
    FakeDumpSource source(Workload());
    TickHook hook;
    SamplerConfigBuilder builder;
    builder.dumper(ThreadDumper::all()).sampling_interval(1).minimum_tick_duration(0ms);
    auto sampler = MakeSampler(builder, source, &hook);
    sampler->start();

    std::this_thread::sleep_for(30ms);
    hook.on_tick();
    EXPECT_GT(sampler->total_samples(), 0u);
    sampler->stop();
}
