#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "fake_dump_source.hpp"
#include "profiler_service.hpp"

using namespace std::chrono_literals;

static SamplerConfig Config(std::optional<std::chrono::milliseconds> min_tick = std::nullopt) {
    SamplerConfigBuilder builder;
    builder.dumper(ThreadDumper::all()).sampling_interval(1);
    if (min_tick.has_value()) {
        builder.minimum_tick_duration(*min_tick);
    }
    return std::move(builder.build()).getOkRef();
}

TEST(ProfilerService, OnlyOneActiveSampler) {
    FakeDumpSource source({Thread(1, "main", {Frame("App", "main")})});
    ProfilerService service(source);

    std::vector<std::string> errors;
    auto on_error = [&errors](const std::string& message) { errors.push_back(message); };

    auto first = service.create(Config(), on_error);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(service.active(), first);

    auto second = service.create(Config(), on_error);
    EXPECT_EQ(second, nullptr);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Another profiler is already active!");
    EXPECT_EQ(service.active(), first);

    first->start();
    service.clear_and_stop();
    EXPECT_EQ(first->state(), SamplerState::STOPPED);
    EXPECT_EQ(service.active(), nullptr);

    auto third = service.create(Config(), on_error);
    EXPECT_NE(third, nullptr);
    EXPECT_EQ(errors.size(), 1u);
}

TEST(ProfilerService, ClearKeepsSamplerRunning) {
    FakeDumpSource source;
    ProfilerService service(source);
    auto sampler = service.create(Config(), [](const std::string&) { FAIL(); });
    ASSERT_NE(sampler, nullptr);
    sampler->start();

    EXPECT_TRUE(service.clear(sampler));
    EXPECT_EQ(service.active(), nullptr);
    EXPECT_TRUE(sampler->is_running());
    EXPECT_FALSE(service.clear(sampler));
    sampler->stop();
}

TEST(ProfilerService, ClearLeavesNewerSessionAlone) {
    FakeDumpSource source;
    ProfilerService service(source);
    auto first = service.create(Config(), [](const std::string&) { FAIL(); });
    ASSERT_NE(first, nullptr);
    first->start();
    first->stop();

    // a cancel during report hand-off lets a new session in
    service.cancel_active();
    auto second = service.create(Config(), [](const std::string&) { FAIL(); });
    ASSERT_NE(second, nullptr);

    EXPECT_FALSE(service.clear(first));
    EXPECT_EQ(service.active(), second);
    EXPECT_FALSE(service.clear(nullptr));
    EXPECT_EQ(service.active(), second);
}

TEST(ProfilerService, StoppedSamplerStaysActiveUntilCleared) {
    FakeDumpSource source;
    ProfilerService service(source);
    auto sampler = service.create(Config(), [](const std::string&) { FAIL(); });
    sampler->start();
    sampler->stop();
    EXPECT_EQ(service.active(), sampler);
}

TEST(ProfilerService, CancelActive) {
    FakeDumpSource source;
    ProfilerService service(source);
    auto sampler = service.create(Config(), [](const std::string&) { FAIL(); });
    sampler->start();

    service.cancel_active();
    EXPECT_EQ(service.active(), nullptr);
    EXPECT_EQ(sampler->state(), SamplerState::CANCELLED);
}

TEST(ProfilerService, AbnormalEndClearsActive) {
    FakeDumpSource source;
    ProfilerService service(source);
    auto sampler = service.create(Config(), [](const std::string&) { FAIL(); });
    sampler->cancel();
    EXPECT_EQ(service.active(), nullptr);

    ThrowingDumpSource broken;
    ProfilerService broken_service(broken);
    auto failing = broken_service.create(Config(), [](const std::string&) { FAIL(); });
    failing->start();
    ASSERT_TRUE(failing->completion().wait_for(10s).has_value());
    EXPECT_EQ(failing->state(), SamplerState::FAILED);
    EXPECT_EQ(broken_service.active(), nullptr);
}

TEST(ProfilerService, TickedModeNeedsHook) {
    FakeDumpSource source;
    ProfilerService service(source);
    EXPECT_FALSE(service.supports_ticks());

    std::vector<std::string> errors;
    auto sampler = service.create(Config(10ms), [&errors](const std::string& message) { errors.push_back(message); });
    EXPECT_EQ(sampler, nullptr);
    EXPECT_EQ(errors, std::vector<std::string>{"Tick counting is not supported"});
    EXPECT_EQ(service.active(), nullptr);

    TickHook hook;
    ProfilerService ticked_service(source, &hook);
    EXPECT_TRUE(ticked_service.supports_ticks());
    EXPECT_NE(ticked_service.create(Config(10ms), [](const std::string&) { FAIL(); }), nullptr);
}
