#pragma once

#include <ostream>
#include <string>
#include <utility>

#include "activity_log.hpp"
#include "report.hpp"
#include "result.hpp"

// Remote store for serialized reports.
class ReportUploader {
public:
    virtual ~ReportUploader() = default;

    // Returns the key or URL the payload can be retrieved from.
    virtual Result<std::string, std::string> upload(const std::string& payload, const std::string& content_type) = 0;
};

struct HandledReport {
    Activity::Kind kind;
    std::string location;
    // Set when the upload failed and the report was saved instead.
    std::string upload_error;
};

// Hands a finished report to the uploader, falling back to a file in
// output_directory when uploading fails or is not wanted.
class ReportHandler {
public:
    ReportHandler(ReportUploader* uploader, ActivityLog& activity_log, std::string output_directory)
        : uploader(uploader), activity_log(activity_log), output_directory(std::move(output_directory)) {}

    Result<HandledReport, std::string> handle(const Report& report, const std::string& actor, bool save_to_file, std::ostream& out);

    // <output_directory>/profile-<local time>.stackprof, unique within the directory.
    std::string resolve_save_file() const;

private:
    ReportUploader* uploader;
    ActivityLog& activity_log;
    std::string output_directory;
};
