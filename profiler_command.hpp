#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "profiler_service.hpp"
#include "report.hpp"
#include "report_handler.hpp"
#include "thread_dumper.hpp"

struct ProfilerArguments {
    bool parsed = true;
    std::vector<std::string> errors;

    bool info = false;
    bool stop = false;
    bool cancel = false;

    double interval_ms = 4;
    std::vector<std::string> threads;
    bool regex = false;
    int only_ticks_over_ms = -1;
    int timeout_seconds = -1;
    bool combine_all = false;
    bool not_combined = false;
    bool force_fallback_backend = false;
    bool ignore_sleeping = false;
    bool ignore_native = false;
    bool debug = false;

    std::optional<std::string> comment;
    bool order_by_time = false;
    bool save_to_file = false;
    bool merge_parent_calls = false;

    static ProfilerArguments parse(const std::vector<std::string>& args);

    ReportOptions report_options(const std::string& actor) const;
};

// Splits a command line on whitespace; double quotes group words.
std::vector<std::string> split_command_line(const std::string& line);

// Start, info, stop and cancel operations on a ProfilerService, replying in
// plain text. The service, handler and output stream must outlive every
// session started through this command.
class ProfilerCommand {
public:
    ProfilerCommand(ProfilerService& service, ThreadDumper default_dumper, ReportHandler& handler, std::ostream& out, std::string actor);
    ProfilerCommand(const ProfilerCommand&) = delete;
    ProfilerCommand& operator=(const ProfilerCommand&) = delete;
    ~ProfilerCommand();

    // Returns false when the arguments could not be parsed or the requested
    // operation was rejected.
    bool execute(const std::vector<std::string>& args);

    // Stops any active session without handling its report.
    void close();

private:
    // Shared with completion callbacks, which may still run after close().
    struct State {
        // Held while a report is handled; close() waits on it.
        std::mutex lifecycle_mutex;
        bool closed = false;
        std::mutex output_mutex;
        ProfilerService& service;
        ReportHandler& handler;
        std::ostream& out;
        std::string actor;

        State(ProfilerService& service, ReportHandler& handler, std::ostream& out, std::string actor)
            : service(service), handler(handler), out(out), actor(std::move(actor)) {}

        void reply(const std::string& message);
        bool handle_report(Sampler& sampler, const ReportOptions& options, bool save_to_file);
    };

    ThreadDumper default_dumper;
    std::shared_ptr<State> state;

    bool start(const ProfilerArguments& arguments);
    void info();
    bool stop(const ProfilerArguments& arguments);
    bool cancel();
};
