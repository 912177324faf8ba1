#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <vector>
#include <utility>

#include <errno.h>
#include <string.h>
#include <stdio.h>

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include "report_codec.hpp"

using std::string;
using std::move;

namespace pb = stackprof::proto;

static void node_to_proto(const ReportNode& node, pb::StackTraceNode* out) {
    out->set_class_name(node.class_name);
    out->set_method_name(node.method_name);
    out->set_method_desc(node.descriptor);
    out->set_line_number(node.line);
    out->set_native(node.native);
    out->set_count(node.count);
    out->set_time(node.time_ms);
    for (const auto& child: node.children) {
        node_to_proto(child, out->add_children());
    }
}

static ReportNode node_from_proto(const pb::StackTraceNode& node) {
    ReportNode result;
    result.class_name = node.class_name();
    result.method_name = node.method_name();
    result.descriptor = node.method_desc();
    result.line = node.line_number();
    result.native = node.native();
    result.count = node.count();
    result.time_ms = node.time();
    result.children.reserve(node.children_size());
    for (const auto& child: node.children()) {
        result.children.push_back(node_from_proto(child));
    }
    return result;
}

pb::SamplerData report_to_proto(const Report& report) {
    pb::SamplerData data;

    const ReportMetadata& metadata = report.metadata;
    pb::SamplerMetadata* out = data.mutable_metadata();
    out->set_start_time(metadata.start_time_ms);
    out->set_duration(metadata.duration_ms);
    out->set_interval(metadata.interval_ms);
    out->set_order(metadata.order == ThreadOrder::BY_TIME ? pb::SamplerMetadata::BY_TIME : pb::SamplerMetadata::BY_NAME);
    if (metadata.comment.has_value()) {
        out->set_comment(*metadata.comment);
    }
    if (metadata.submitter.has_value()) {
        out->mutable_submitter()->set_name(metadata.submitter->name);
        out->mutable_submitter()->set_id(metadata.submitter->id);
    }
    out->set_merge_parent_calls(metadata.merge_parent_calls);
    out->set_backend(metadata.backend);
    out->set_thread_dumper(metadata.thread_dumper);
    out->set_thread_grouper(metadata.thread_grouper);

    pb::PlatformMetadata* platform = out->mutable_platform();
    platform->set_os_name(metadata.platform.os_name);
    platform->set_os_release(metadata.platform.os_release);
    platform->set_hostname(metadata.platform.hostname);
    platform->set_pid(metadata.platform.pid);

    for (const auto& thread: report.threads) {
        pb::ThreadNode* node = data.add_threads();
        node->set_name(thread.name);
        node->set_count(thread.count);
        node->set_time(thread.time_ms);
        for (const auto& child: thread.children) {
            node_to_proto(child, node->add_children());
        }
    }
    return data;
}

Report report_from_proto(const pb::SamplerData& data) {
    Report report;

    const pb::SamplerMetadata& in = data.metadata();
    ReportMetadata& metadata = report.metadata;
    metadata.start_time_ms = in.start_time();
    metadata.duration_ms = in.duration();
    metadata.interval_ms = in.interval();
    metadata.order = in.order() == pb::SamplerMetadata::BY_TIME ? ThreadOrder::BY_TIME : ThreadOrder::BY_NAME;
    if (in.has_comment()) {
        metadata.comment = in.comment();
    }
    if (in.has_submitter()) {
        metadata.submitter = Submitter { in.submitter().name(), in.submitter().id() };
    }
    metadata.merge_parent_calls = in.merge_parent_calls();
    metadata.backend = in.backend();
    metadata.thread_dumper = in.thread_dumper();
    metadata.thread_grouper = in.thread_grouper();
    metadata.platform.os_name = in.platform().os_name();
    metadata.platform.os_release = in.platform().os_release();
    metadata.platform.hostname = in.platform().hostname();
    metadata.platform.pid = in.platform().pid();

    for (const auto& node: data.threads()) {
        ReportThread thread;
        thread.name = node.name();
        thread.count = node.count();
        thread.time_ms = node.time();
        for (const auto& child: node.children()) {
            thread.children.push_back(node_from_proto(child));
        }
        report.threads.push_back(move(thread));
    }
    return report;
}

static int call_depth(const std::vector<ReportNode>& nodes) {
    int deepest = 0;
    for (const auto& node: nodes) {
        deepest = std::max(deepest, 1 + call_depth(node.children));
    }
    return deepest;
}

Result<string, string> serialize_report(const Report& report) {
    for (const auto& thread: report.threads) {
        int depth = call_depth(thread.children);
        if (depth > REPORT_MAX_CALL_DEPTH) {
            return ResultInit::err("Call path of " + thread.name + " is " + std::to_string(depth)
                + " frames deep, more than the " + std::to_string(REPORT_MAX_CALL_DEPTH) + " a report can hold");
        }
    }

    string payload;
    if (!report_to_proto(report).SerializeToString(&payload)) {
        return ResultInit::err(string("Failed to serialize sampler data"));
    }
    return ResultInit::ok(move(payload));
}

Result<Report, string> parse_report(const string& payload) {
    if (payload.size() > (size_t) std::numeric_limits<int>::max()) {
        return ResultInit::err(string("Sampler data too large"));
    }

    google::protobuf::io::ArrayInputStream input(payload.data(), (int) payload.size());
    google::protobuf::io::CodedInputStream coded(&input);
    // the default limit of 100 is shallower than a real stack
    coded.SetRecursionLimit(REPORT_MAX_CALL_DEPTH + 2);

    pb::SamplerData data;
    if (!data.ParseFromCodedStream(&coded) || !coded.ConsumedEntireMessage()) {
        return ResultInit::err(string("Malformed sampler data"));
    }
    return ResultInit::ok(report_from_proto(data));
}

Status save_report(const Report& report, const string& path) {
    auto payload = serialize_report(report);
    if (!payload.isOk()) {
        return ResultInit::err(string(payload.getErrRef()));
    }

    // write beside the destination and rename so readers never see a partial file
    string temp_path = path + ".tmp";
    {
        std::ofstream stream(temp_path.c_str(), std::ios::binary | std::ios::trunc);
        if (!stream) {
            return ResultInit::err("Unable to open " + temp_path + " for writing: " + strerror(errno));
        }
        const string& bytes = payload.getOkRef();
        stream.write(bytes.data(), bytes.size());
        stream.flush();
        if (!stream) {
            return ResultInit::err("Unable to write " + temp_path);
        }
    }

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        int errno_copy = errno;
        if (remove(temp_path.c_str()) != 0) {
            std::cerr << "Unable to remove " << temp_path << ": " << strerror(errno) << "\n";
        }
        return ResultInit::err("rename(" + temp_path + ", " + path + ") failed: " + strerror(errno_copy));
    }
    return ResultInit::ok();
}

Result<Report, string> load_report(const string& path) {
    std::ifstream stream(path.c_str(), std::ios::binary);
    if (!stream) {
        return ResultInit::err("Unable to open " + path + ": " + strerror(errno));
    }
    string payload((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    if (stream.bad()) {
        return ResultInit::err("Unable to read " + path);
    }
    return parse_report(payload);
}
