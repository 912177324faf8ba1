#pragma once

#include <string>

#include "report.hpp"
#include "result.hpp"
#include "report.pb.h"

constexpr const char* REPORT_CONTENT_TYPE = "application/x-stackprof-sampler";

// Deepest call path a persisted report may hold. Each frame is one level of
// message nesting; SamplerData and ThreadNode add two more.
constexpr int REPORT_MAX_CALL_DEPTH = 1024;

stackprof::proto::SamplerData report_to_proto(const Report& report);
Report report_from_proto(const stackprof::proto::SamplerData& data);

Result<std::string, std::string> serialize_report(const Report& report);
Result<Report, std::string> parse_report(const std::string& payload);

Status save_report(const Report& report, const std::string& path);
Result<Report, std::string> load_report(const std::string& path);
