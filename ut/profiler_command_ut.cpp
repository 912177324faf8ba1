#include <chrono>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <thread>

#include <unistd.h>

#include <gtest/gtest.h>

#include "fake_dump_source.hpp"
#include "profiler_command.hpp"
#include "report_codec.hpp"

using namespace std::chrono_literals;

static bool Contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

TEST(ProfilerArguments, Defaults) {
    auto args = ProfilerArguments::parse({});
    EXPECT_TRUE(args.parsed);
    EXPECT_DOUBLE_EQ(args.interval_ms, 4);
    EXPECT_EQ(args.timeout_seconds, -1);
    EXPECT_EQ(args.only_ticks_over_ms, -1);
    EXPECT_FALSE(args.stop);
}

TEST(ProfilerArguments, ParsesFlags) {
    auto args = ProfilerArguments::parse({
        "--interval", "0.5", "--thread", "main", "--thread", "Worker-1", "--timeout", "30",
        "--not-combined", "--ignore-sleeping", "--comment", "slow frame", "--order-by-time",
        "--merge-parent-calls", "--save-to-file",
    });
    ASSERT_TRUE(args.parsed);
    EXPECT_DOUBLE_EQ(args.interval_ms, 0.5);
    EXPECT_EQ(args.threads, (std::vector<std::string>{"main", "Worker-1"}));
    EXPECT_EQ(args.timeout_seconds, 30);
    EXPECT_TRUE(args.not_combined);
    EXPECT_TRUE(args.ignore_sleeping);
    EXPECT_TRUE(args.save_to_file);

    ReportOptions options = args.report_options("alice");
    EXPECT_EQ(options.order, ThreadOrder::BY_TIME);
    EXPECT_EQ(options.comment, std::optional<std::string>("slow frame"));
    EXPECT_TRUE(options.merge_parent_calls);
    ASSERT_TRUE(options.submitter.has_value());
    EXPECT_EQ(options.submitter->name, "alice");
}

TEST(ProfilerArguments, NonPositiveIntervalFallsBackToDefault) {
    EXPECT_DOUBLE_EQ(ProfilerArguments::parse({"--interval", "0"}).interval_ms, 4);
    EXPECT_DOUBLE_EQ(ProfilerArguments::parse({"--interval", "-3"}).interval_ms, 4);
}

TEST(ProfilerArguments, Rejects) {
    EXPECT_FALSE(ProfilerArguments::parse({"--combine-all", "--not-combined"}).parsed);
    EXPECT_FALSE(ProfilerArguments::parse({"--timeout"}).parsed);
    EXPECT_FALSE(ProfilerArguments::parse({"--timeout", "soon"}).parsed);
    EXPECT_FALSE(ProfilerArguments::parse({"--bogus"}).parsed);
}

TEST(ProfilerArguments, RejectsOutOfRangeIntegers) {
    EXPECT_FALSE(ProfilerArguments::parse({"--timeout", "4294967297"}).parsed);
    EXPECT_FALSE(ProfilerArguments::parse({"--timeout", "99999999999999999999999"}).parsed);
    EXPECT_FALSE(ProfilerArguments::parse({"--only-ticks-over", "-4294967296"}).parsed);

    auto args = ProfilerArguments::parse({"--timeout", "2147483647"});
    ASSERT_TRUE(args.parsed);
    EXPECT_EQ(args.timeout_seconds, 2147483647);
}

TEST(SplitCommandLine, QuotesGroupWords) {
    EXPECT_EQ(split_command_line("--comment \"two words\" --stop"),
        (std::vector<std::string>{"--comment", "two words", "--stop"}));
    EXPECT_EQ(split_command_line("  --info\t"), std::vector<std::string>{"--info"});
    EXPECT_EQ(split_command_line("--comment \"\""), (std::vector<std::string>{"--comment", ""}));
    EXPECT_TRUE(split_command_line("   ").empty());
}

class ProfilerCommandTest : public testing::Test {
protected:
    ProfilerCommandTest()
        : source({
            Thread(10, "main", {Frame("App", "update"), Frame("App", "main")}),
            Thread(11, "Worker-1", {Frame("Pool", "run")}),
        })
        , service(source)
        , handler(nullptr, log, testing::TempDir())
        , command(service, MainThread(), handler, out, "tester")
    {}

    ~ProfilerCommandTest() override {
        command.close();
        for (const auto& entry: log.entries()) {
            unlink(entry.location.c_str());
        }
    }

    static ThreadDumper MainThread() {
        return ThreadDumper::host_default("main thread", [](const ThreadSnapshot& thread) {
            return thread.tid == 10;
        });
    }

    bool WaitUntilIdle() {
        for (int i = 0; i < 1000 && service.active(); ++i) {
            std::this_thread::sleep_for(10ms);
        }
        return service.active() == nullptr;
    }

    FakeDumpSource source;
    ProfilerService service;
    ActivityLog log;
    ReportHandler handler;
    std::ostringstream out;
    ProfilerCommand command;
};

TEST_F(ProfilerCommandTest, StartInfoStop) {
    ASSERT_TRUE(command.execute({"--interval", "1"}));
    auto sampler = service.active();
    ASSERT_NE(sampler, nullptr);
    EXPECT_EQ(sampler->config().dumper.kind, ThreadDumper::Kind::DEFAULT);
    EXPECT_EQ(sampler->config().grouper.kind, ThreadGrouper::Kind::BY_POOL);

    EXPECT_TRUE(command.execute({"--info"}));
    std::this_thread::sleep_for(30ms);
    EXPECT_TRUE(command.execute({"--stop", "--comment", "first run"}));

    EXPECT_EQ(service.active(), nullptr);
    EXPECT_EQ(sampler->state(), SamplerState::STOPPED);

    std::string text = out.str();
    EXPECT_TRUE(Contains(text, "Profiler now active!"));
    EXPECT_TRUE(Contains(text, "no defined timeout"));
    EXPECT_TRUE(Contains(text, "has been stopped"));
    EXPECT_TRUE(Contains(text, "Profile written to:"));

    auto entries = log.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].actor, "tester");
    EXPECT_EQ(entries[0].kind, Activity::Kind::FILE);
    EXPECT_EQ(access(entries[0].location.c_str(), F_OK), 0);
}

TEST_F(ProfilerCommandTest, SecondStartIsRejected) {
    ASSERT_TRUE(command.execute({"--thread", "*"}));
    EXPECT_EQ(service.active()->config().dumper.kind, ThreadDumper::Kind::ALL);
    EXPECT_FALSE(command.execute({}));
    EXPECT_TRUE(Contains(out.str(), "Another profiler is already active!"));
    EXPECT_TRUE(command.execute({"--cancel"}));
}

TEST_F(ProfilerCommandTest, NothingToStop) {
    EXPECT_FALSE(command.execute({"--stop"}));
    EXPECT_FALSE(command.execute({"--cancel"}));
    EXPECT_TRUE(command.execute({"--info"}));
    EXPECT_TRUE(Contains(out.str(), "There isn't an active profiler running."));
    EXPECT_TRUE(log.entries().empty());
}

TEST_F(ProfilerCommandTest, CancelProducesNoReport) {
    ASSERT_TRUE(command.execute({"--interval", "1", "--combine-all"}));
    auto sampler = service.active();
    EXPECT_EQ(sampler->config().grouper.kind, ThreadGrouper::Kind::AS_ONE);
    std::this_thread::sleep_for(20ms);

    EXPECT_TRUE(command.execute({"--cancel"}));
    EXPECT_EQ(service.active(), nullptr);
    EXPECT_EQ(sampler->state(), SamplerState::CANCELLED);
    EXPECT_TRUE(log.entries().empty());
}

TEST_F(ProfilerCommandTest, TimeoutReportsAutomatically) {
    ASSERT_TRUE(command.execute({"--interval", "1", "--timeout", "1", "--thread", "worker-\\d+", "--regex"}));
    EXPECT_EQ(service.active()->config().dumper.kind, ThreadDumper::Kind::REGEX);
    ASSERT_TRUE(WaitUntilIdle());

    EXPECT_TRUE(Contains(out.str(), "The active profiler has completed!"));
    auto entries = log.entries();
    ASSERT_EQ(entries.size(), 1u);

    auto loaded = load_report(entries[0].location);
    ASSERT_TRUE(loaded.isOk()) << loaded.getErrRef();
    ASSERT_EQ(loaded.getOkRef().threads.size(), 1u);
    EXPECT_EQ(loaded.getOkRef().threads[0].name, "Worker");
}

TEST_F(ProfilerCommandTest, InfiniteIntervalIsRejected) {
    EXPECT_FALSE(command.execute({"--interval", "inf"}));
    EXPECT_FALSE(command.execute({"--interval", "1e300"}));
    EXPECT_TRUE(Contains(out.str(), "Sampling interval"));
    EXPECT_EQ(service.active(), nullptr);
}

TEST_F(ProfilerCommandTest, TickedModeUnsupportedWithoutHook) {
    EXPECT_FALSE(command.execute({"--only-ticks-over", "50"}));
    EXPECT_TRUE(Contains(out.str(), "Tick counting is not supported"));
    EXPECT_EQ(service.active(), nullptr);
}

// Holds every upload until released, then fails it so the report is saved.
class GatedUploader : public ReportUploader {
public:
    Result<std::string, std::string> upload(const std::string&, const std::string&) override {
        std::unique_lock<std::mutex> lock(mutex);
        entered = true;
        cv.notify_all();
        cv.wait(lock, [this] { return released; });
        return ResultInit::err(std::string("upload released"));
    }

    bool wait_entered() {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(10), [this] { return entered; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex);
        released = true;
        cv.notify_all();
    }

private:
    std::mutex mutex;
    std::condition_variable cv;
    bool entered = false;
    bool released = false;
};

TEST(ProfilerCommand, FinishedUploadKeepsNewerSessionActive) {
    FakeDumpSource source({Thread(10, "main", {Frame("App", "main")})});
    ProfilerService service(source);
    ActivityLog log;
    GatedUploader uploader;
    ReportHandler handler(&uploader, log, testing::TempDir());
    std::ostringstream out;
    ProfilerCommand command(service, ThreadDumper::all(), handler, out, "tester");

    ASSERT_TRUE(command.execute({"--interval", "1"}));
    auto first = service.active();
    ASSERT_NE(first, nullptr);
    std::this_thread::sleep_for(10ms);

    bool stopped = false;
    std::thread stopper([&command, &stopped] {
        stopped = command.execute({"--stop"});
    });
    ASSERT_TRUE(uploader.wait_entered());

    // the stopped session is still registered while its report is uploading
    EXPECT_EQ(service.active(), first);
    EXPECT_TRUE(command.execute({"--cancel"}));
    ASSERT_TRUE(command.execute({"--interval", "1"}));
    auto second = service.active();
    ASSERT_NE(second, nullptr);
    EXPECT_NE(second, first);

    uploader.release();
    stopper.join();

    EXPECT_TRUE(stopped);
    EXPECT_EQ(first->state(), SamplerState::STOPPED);
    EXPECT_EQ(service.active(), second);
    EXPECT_TRUE(second->is_running());

    command.close();
    EXPECT_EQ(second->state(), SamplerState::STOPPED);
    for (const auto& entry: log.entries()) {
        unlink(entry.location.c_str());
    }
}
