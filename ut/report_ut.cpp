#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "fake_dump_source.hpp"
#include "report.hpp"
#include "report_codec.hpp"

using namespace std::chrono_literals;

static std::shared_ptr<Sampler> RunSampler(ThreadDumpSource& source, ThreadGrouper grouper = ThreadGrouper::by_name()) {
    SamplerConfigBuilder builder;
    builder.dumper(ThreadDumper::all()).grouper(grouper).sampling_interval(1);
    auto sampler = std::make_shared<Sampler>(std::move(builder.build()).getOkRef(), source);
    sampler->start();
    while (sampler->total_samples() == 0) {
        std::this_thread::sleep_for(5ms);
    }
    sampler->stop();
    return sampler;
}

static const ReportNode* Child(const std::vector<ReportNode>& nodes, const std::string& method) {
    for (const auto& node: nodes) {
        if (node.method_name == method) {
            return &node;
        }
    }
    return nullptr;
}

static const ReportThread* FindThread(const Report& report, const std::string& name) {
    for (const auto& thread: report.threads) {
        if (thread.name == name) {
            return &thread;
        }
    }
    return nullptr;
}

TEST(Report, RequiresStoppedSampler) {
    FakeDumpSource source({Thread(1, "main", {Frame("App", "main")})});
    SamplerConfigBuilder builder;
    auto sampler = std::make_shared<Sampler>(std::move(builder.build()).getOkRef(), source);
    EXPECT_THROW(build_report(*sampler, ReportOptions()), std::logic_error);

    sampler->start();
    EXPECT_THROW(build_report(*sampler, ReportOptions()), std::logic_error);

    sampler->cancel();
    EXPECT_THROW(build_report(*sampler, ReportOptions()), std::logic_error);
}

TEST(Report, MetadataAndTotals) {
    FakeDumpSource source({
        Thread(1, "main", {Frame("App", "compute"), Frame("App", "main")}),
        Thread(2, "Worker-1", {Frame("Pool", "run")}),
    });
    auto sampler = RunSampler(source);

    ReportOptions options;
    options.comment = std::string("nightly");
    options.submitter = Submitter { "alice", "alice" };
    Report report = build_report(*sampler, options);

    EXPECT_EQ(report.total_samples(), sampler->total_samples());
    EXPECT_EQ(report.metadata.comment, std::optional<std::string>("nightly"));
    ASSERT_TRUE(report.metadata.submitter.has_value());
    EXPECT_EQ(report.metadata.submitter->name, "alice");
    EXPECT_DOUBLE_EQ(report.metadata.interval_ms, 1);
    EXPECT_EQ(report.metadata.backend, sampler->backend_name());
    EXPECT_EQ(report.metadata.thread_dumper, "all");
    EXPECT_EQ(report.metadata.thread_grouper, "by-name");
    EXPECT_GE(report.metadata.duration_ms, 0);
    EXPECT_GT(report.metadata.platform.pid, 0);

    ASSERT_EQ(report.threads.size(), 2u);
    EXPECT_EQ(report.threads[0].name, "Worker-1");
    EXPECT_EQ(report.threads[1].name, "main");

    const ReportNode* main = Child(report.threads[1].children, "main");
    ASSERT_NE(main, nullptr);
    EXPECT_EQ(main->count, report.threads[1].count);
    ASSERT_NE(Child(main->children, "compute"), nullptr);
}

TEST(Report, OrderingDoesNotChangeCounts) {
    FakeDumpSource source({
        Thread(1, "a", {Frame("App", "x")}),
        Thread(2, "b", {Frame("App", "y")}),
        Thread(3, "b", {Frame("App", "z")}),
    });
    auto sampler = RunSampler(source);

    ReportOptions by_name;
    ReportOptions by_time;
    by_time.order = ThreadOrder::BY_TIME;
    Report first = build_report(*sampler, by_name);
    Report second = build_report(*sampler, by_time);

    EXPECT_EQ(first.total_samples(), second.total_samples());
    ASSERT_EQ(second.threads.size(), 2u);
    // two threads feed group "b"
    EXPECT_EQ(second.threads[0].name, "b");
    EXPECT_EQ(second.threads[0].count, 2 * second.threads[1].count);
    EXPECT_EQ(FindThread(first, "b")->count, FindThread(second, "b")->count);
}

TEST(Report, MergeParentCallsCollapsesSelfRecursion) {
    // a -> a -> b
    FakeDumpSource source({Thread(1, "main", {Frame("App", "b"), Frame("App", "a"), Frame("App", "a")})});
    auto sampler = RunSampler(source);

    Report plain = build_report(*sampler, ReportOptions());
    const ReportThread& plain_main = plain.threads.at(0);
    const ReportNode* outer = Child(plain_main.children, "a");
    ASSERT_NE(outer, nullptr);
    ASSERT_NE(Child(outer->children, "a"), nullptr);

    ReportOptions options;
    options.merge_parent_calls = true;
    Report merged = build_report(*sampler, options);
    const ReportThread& main = merged.threads.at(0);
    uint64_t samples = main.count;

    ASSERT_EQ(main.children.size(), 1u);
    const ReportNode& a = main.children[0];
    EXPECT_EQ(a.method_name, "a");
    EXPECT_EQ(a.count, 2 * samples);
    ASSERT_EQ(a.children.size(), 1u);
    EXPECT_EQ(a.children[0].method_name, "b");
    EXPECT_EQ(a.children[0].count, samples);
}

TEST(Report, MergeKeepsDistinctPaths) {
    FakeDumpSource source({
        Thread(1, "one", {Frame("App", "c"), Frame("App", "b"), Frame("App", "a")}),
        Thread(2, "two", {Frame("App", "c"), Frame("App", "d"), Frame("App", "a")}),
    });
    auto sampler = RunSampler(source, ThreadGrouper::as_one());

    ReportOptions options;
    options.merge_parent_calls = true;
    Report report = build_report(*sampler, options);
    ASSERT_EQ(report.threads.size(), 1u);
    EXPECT_EQ(report.threads[0].name, "all");

    const ReportNode* a = Child(report.threads[0].children, "a");
    ASSERT_NE(a, nullptr);
    ASSERT_EQ(a->children.size(), 2u);
    const ReportNode* b = Child(a->children, "b");
    const ReportNode* d = Child(a->children, "d");
    ASSERT_NE(b, nullptr);
    ASSERT_NE(d, nullptr);
    ASSERT_NE(Child(b->children, "c"), nullptr);
    ASSERT_NE(Child(d->children, "c"), nullptr);
    EXPECT_EQ(b->count, d->count);
}

TEST(Report, OverloadsAreDisambiguated) {
    FakeDumpSource source({
        Thread(1, "main", {Frame("App", "run", "(int)"), Frame("App", "main")}),
        Thread(2, "main", {Frame("App", "run", "(string)"), Frame("App", "main")}),
        Thread(3, "main", {Frame("App", "stop", "(int)"), Frame("App", "main")}),
    });
    auto sampler = RunSampler(source);
    Report report = build_report(*sampler, ReportOptions());

    const ReportNode* main = Child(report.threads.at(0).children, "main");
    ASSERT_NE(main, nullptr);
    EXPECT_NE(Child(main->children, "run(int)"), nullptr);
    EXPECT_NE(Child(main->children, "run(string)"), nullptr);
    EXPECT_NE(Child(main->children, "stop"), nullptr);
}

TEST(ReportCodec, SaveAndLoad) {
    FakeDumpSource source({Thread(1, "main", {Frame("App", "compute", "(int)"), Frame("libc", "start", "", true)})});
    auto sampler = RunSampler(source);

    ReportOptions options;
    options.order = ThreadOrder::BY_TIME;
    options.comment = std::string("");
    Report report = build_report(*sampler, options);

    std::string path = testing::TempDir() + "report_codec_ut.stackprof";
    ASSERT_TRUE(save_report(report, path).isOk());
    auto loaded = load_report(path);
    ASSERT_TRUE(loaded.isOk()) << loaded.getErrRef();
    std::remove(path.c_str());

    const Report& copy = loaded.getOkRef();
    EXPECT_EQ(copy.metadata.order, ThreadOrder::BY_TIME);
    ASSERT_TRUE(copy.metadata.comment.has_value());
    EXPECT_EQ(*copy.metadata.comment, "");
    EXPECT_FALSE(copy.metadata.submitter.has_value());
    EXPECT_EQ(copy.metadata.backend, report.metadata.backend);
    EXPECT_EQ(copy.total_samples(), report.total_samples());

    const ReportNode* start = Child(copy.threads.at(0).children, "start");
    ASSERT_NE(start, nullptr);
    EXPECT_TRUE(start->native);
    const ReportNode* compute = Child(start->children, "compute");
    ASSERT_NE(compute, nullptr);
    EXPECT_EQ(compute->descriptor, "(int)");
    EXPECT_FALSE(compute->native);
}

static Report LinearReport(int depth) {
    Report report;
    ReportThread thread;
    thread.name = "main";
    thread.count = 1;
    thread.time_ms = 4;

    std::vector<ReportNode>* level = &thread.children;
    for (int i = 0; i < depth; ++i) {
        ReportNode node;
        node.class_name = "App";
        node.method_name = "frame" + std::to_string(i);
        node.count = 1;
        node.time_ms = 4;
        level->push_back(node);
        level = &level->back().children;
    }
    report.threads.push_back(std::move(thread));
    return report;
}

static int Depth(const std::vector<ReportNode>& nodes) {
    int depth = 0;
    const std::vector<ReportNode>* level = &nodes;
    while (!level->empty()) {
        ++depth;
        level = &level->front().children;
    }
    return depth;
}

TEST(ReportCodec, DeepStacksSurviveSaveAndLoad) {
    for (int depth: {97, 98, 256, REPORT_MAX_CALL_DEPTH}) {
        std::string path = testing::TempDir() + "report_codec_deep_ut.stackprof";
        ASSERT_TRUE(save_report(LinearReport(depth), path).isOk()) << depth;
        auto loaded = load_report(path);
        std::remove(path.c_str());

        ASSERT_TRUE(loaded.isOk()) << depth << ": " << loaded.getErrRef();
        const auto& children = loaded.getOkRef().threads.at(0).children;
        EXPECT_EQ(Depth(children), depth);

        const std::vector<ReportNode>* level = &children;
        for (int i = 0; i + 1 < depth; ++i) {
            level = &level->front().children;
        }
        EXPECT_EQ(level->front().method_name, "frame" + std::to_string(depth - 1));
    }
}

TEST(ReportCodec, TooDeepStackIsNotSaved) {
    std::string path = testing::TempDir() + "report_codec_too_deep_ut.stackprof";
    EXPECT_FALSE(save_report(LinearReport(REPORT_MAX_CALL_DEPTH + 1), path).isOk());
    EXPECT_FALSE(serialize_report(LinearReport(REPORT_MAX_CALL_DEPTH + 1)).isOk());
}

TEST(ReportCodec, RejectsGarbage) {
    EXPECT_FALSE(parse_report(std::string("\xff\xff\xff\xff", 4)).isOk());
    EXPECT_FALSE(load_report(testing::TempDir() + "does-not-exist.stackprof").isOk());
}
