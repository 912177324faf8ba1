#include <sstream>

#include <unistd.h>

#include <gtest/gtest.h>

#include "report_codec.hpp"
#include "report_handler.hpp"

class FailingUploader : public ReportUploader {
public:
    Result<std::string, std::string> upload(const std::string&, const std::string&) override {
        ++attempts;
        return ResultInit::err(std::string("connection refused"));
    }

    int attempts = 0;
};

class RecordingUploader : public ReportUploader {
public:
    Result<std::string, std::string> upload(const std::string& payload, const std::string& content_type) override {
        last_payload = payload;
        last_content_type = content_type;
        return ResultInit::ok(std::string("https://profiles.example/abc123"));
    }

    std::string last_payload;
    std::string last_content_type;
};

static Report SmallReport() {
    Report report;
    report.metadata.interval_ms = 4;
    ReportThread thread;
    thread.name = "main";
    thread.count = 3;
    thread.time_ms = 12;
    ReportNode node;
    node.class_name = "App";
    node.method_name = "main";
    node.count = 3;
    node.time_ms = 12;
    thread.children.push_back(node);
    report.threads.push_back(thread);
    return report;
}

TEST(ReportHandler, UploadSucceeds) {
    RecordingUploader uploader;
    ActivityLog log;
    ReportHandler handler(&uploader, log, testing::TempDir());
    std::ostringstream out;

    auto handled = handler.handle(SmallReport(), "alice", false, out);
    ASSERT_TRUE(handled.isOk()) << handled.getErrRef();
    EXPECT_EQ(handled.getOkRef().kind, Activity::Kind::URL);
    EXPECT_EQ(handled.getOkRef().location, "https://profiles.example/abc123");
    EXPECT_EQ(uploader.last_content_type, REPORT_CONTENT_TYPE);
    EXPECT_NE(out.str().find("https://profiles.example/abc123"), std::string::npos);

    auto parsed = parse_report(uploader.last_payload);
    ASSERT_TRUE(parsed.isOk());
    EXPECT_EQ(parsed.getOkRef().total_samples(), 3u);

    auto entries = log.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].actor, "alice");
    EXPECT_EQ(entries[0].kind, Activity::Kind::URL);
}

TEST(ReportHandler, FailedUploadFallsBackToFile) {
    FailingUploader uploader;
    ActivityLog log;
    ReportHandler handler(&uploader, log, testing::TempDir());
    std::ostringstream out;

    auto handled = handler.handle(SmallReport(), "bob", false, out);
    ASSERT_TRUE(handled.isOk()) << handled.getErrRef();
    EXPECT_EQ(uploader.attempts, 1);
    EXPECT_EQ(handled.getOkRef().kind, Activity::Kind::FILE);
    EXPECT_EQ(handled.getOkRef().upload_error, "connection refused");
    EXPECT_NE(out.str().find("Attempting to save to disk instead"), std::string::npos);

    const std::string& path = handled.getOkRef().location;
    auto loaded = load_report(path);
    ASSERT_TRUE(loaded.isOk()) << loaded.getErrRef();
    EXPECT_EQ(loaded.getOkRef().threads.at(0).name, "main");
    unlink(path.c_str());

    auto entries = log.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].kind, Activity::Kind::FILE);
    EXPECT_EQ(entries[0].location, path);
}

TEST(ReportHandler, SaveToFileSkipsUpload) {
    FailingUploader uploader;
    ActivityLog log;
    ReportHandler handler(&uploader, log, testing::TempDir());
    std::ostringstream out;

    auto handled = handler.handle(SmallReport(), "carol", true, out);
    ASSERT_TRUE(handled.isOk());
    EXPECT_EQ(uploader.attempts, 0);
    EXPECT_TRUE(handled.getOkRef().upload_error.empty());
    unlink(handled.getOkRef().location.c_str());
}

TEST(ReportHandler, SaveFilesNeverCollide) {
    ActivityLog log;
    ReportHandler handler(nullptr, log, testing::TempDir());
    std::ostringstream out;

    auto first = handler.handle(SmallReport(), "dave", false, out);
    auto second = handler.handle(SmallReport(), "dave", false, out);
    ASSERT_TRUE(first.isOk());
    ASSERT_TRUE(second.isOk());
    EXPECT_NE(first.getOkRef().location, second.getOkRef().location);
    EXPECT_NE(first.getOkRef().location.find(".stackprof"), std::string::npos);
    unlink(first.getOkRef().location.c_str());
    unlink(second.getOkRef().location.c_str());
    EXPECT_EQ(log.entries().size(), 2u);
}

TEST(ReportHandler, UnwritableDirectoryFails) {
    ActivityLog log;
    ReportHandler handler(nullptr, log, "/nonexistent/stackprof/output");
    std::ostringstream out;

    auto handled = handler.handle(SmallReport(), "erin", true, out);
    EXPECT_FALSE(handled.isOk());
    EXPECT_TRUE(log.entries().empty());
}
