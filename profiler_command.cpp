#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <utility>

#include "profiler_command.hpp"

using std::string;
using std::vector;
using std::move;

static bool parse_int(const string& value, int& out) {
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || errno == ERANGE) {
        return false;
    }
    if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
        return false;
    }
    out = (int) parsed;
    return true;
}

static bool parse_double(const string& value, double& out) {
    char* end = nullptr;
    double parsed = std::strtod(value.c_str(), &end);
    if (value.empty() || *end != '\0') {
        return false;
    }
    out = parsed;
    return true;
}

ProfilerArguments ProfilerArguments::parse(const vector<string>& args) {
    ProfilerArguments result;

    auto value_of = [&](vector<string>::const_iterator& it, const string& flag) -> std::optional<string> {
        if (it + 1 == args.end()) {
            result.errors.push_back(flag + " requires a value");
            result.parsed = false;
            return std::nullopt;
        }
        ++it;
        return *it;
    };

    for (auto it = args.begin(); it != args.end(); ++it) {
        const string& arg = *it;
        if (arg == "--info") {
            result.info = true;
        } else if (arg == "--stop" || arg == "--upload") {
            result.stop = true;
        } else if (arg == "--cancel") {
            result.cancel = true;
        } else if (arg == "--interval") {
            auto value = value_of(it, arg);
            if (value.has_value() && !parse_double(*value, result.interval_ms)) {
                result.errors.push_back("Invalid interval: " + *value);
                result.parsed = false;
            }
        } else if (arg == "--thread") {
            auto value = value_of(it, arg);
            if (value.has_value()) {
                result.threads.push_back(*value);
            }
        } else if (arg == "--regex") {
            result.regex = true;
        } else if (arg == "--only-ticks-over") {
            auto value = value_of(it, arg);
            if (value.has_value() && !parse_int(*value, result.only_ticks_over_ms)) {
                result.errors.push_back("Invalid tick length: " + *value);
                result.parsed = false;
            }
        } else if (arg == "--timeout") {
            auto value = value_of(it, arg);
            if (value.has_value() && !parse_int(*value, result.timeout_seconds)) {
                result.errors.push_back("Invalid timeout: " + *value);
                result.parsed = false;
            }
        } else if (arg == "--combine-all") {
            result.combine_all = true;
        } else if (arg == "--not-combined") {
            result.not_combined = true;
        } else if (arg == "--force-fallback-backend") {
            result.force_fallback_backend = true;
        } else if (arg == "--ignore-sleeping") {
            result.ignore_sleeping = true;
        } else if (arg == "--ignore-native") {
            result.ignore_native = true;
        } else if (arg == "--comment") {
            auto value = value_of(it, arg);
            if (value.has_value()) {
                result.comment = *value;
            }
        } else if (arg == "--order-by-time") {
            result.order_by_time = true;
        } else if (arg == "--save-to-file") {
            result.save_to_file = true;
        } else if (arg == "--merge-parent-calls") {
            result.merge_parent_calls = true;
        } else if (arg == "--debug") {
            result.debug = true;
        } else {
            result.errors.push_back("Unknown argument: " + arg);
            result.parsed = false;
        }
    }

    if (result.interval_ms <= 0) {
        result.interval_ms = 4;
    }
    if (result.combine_all && result.not_combined) {
        result.errors.push_back("--combine-all and --not-combined are mutually exclusive");
        result.parsed = false;
    }

    return result;
}

ReportOptions ProfilerArguments::report_options(const string& actor) const {
    ReportOptions options;
    options.order = order_by_time ? ThreadOrder::BY_TIME : ThreadOrder::BY_NAME;
    options.comment = comment;
    options.submitter = Submitter { actor, actor };
    options.merge_parent_calls = merge_parent_calls;
    return options;
}

vector<string> split_command_line(const string& line) {
    vector<string> words;
    string current;
    bool quoted = false;
    bool has_word = false;

    for (char c: line) {
        if (c == '"') {
            quoted = !quoted;
            has_word = true;
        } else if (!quoted && (c == ' ' || c == '\t' || c == '\r' || c == '\n')) {
            if (has_word) {
                words.push_back(move(current));
                current.clear();
                has_word = false;
            }
        } else {
            current += c;
            has_word = true;
        }
    }
    if (has_word) {
        words.push_back(move(current));
    }
    return words;
}

void ProfilerCommand::State::reply(const string& message) {
    std::lock_guard<std::mutex> lock(output_mutex);
    out << message << "\n";
    out.flush();
}

bool ProfilerCommand::State::handle_report(Sampler& sampler, const ReportOptions& options, bool save_to_file) {
    Report report = build_report(sampler, options);

    std::ostringstream messages;
    auto handled = handler.handle(report, actor, save_to_file, messages);

    string text = messages.str();
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    if (!text.empty()) {
        reply(text);
    }
    if (!handled.isOk()) {
        reply("Error: " + handled.getErrRef());
        return false;
    }
    return true;
}

ProfilerCommand::ProfilerCommand(ProfilerService& service, ThreadDumper default_dumper, ReportHandler& handler, std::ostream& out, string actor)
    : default_dumper(move(default_dumper)), state(std::make_shared<State>(service, handler, out, move(actor))) {}

ProfilerCommand::~ProfilerCommand() {
    close();
}

void ProfilerCommand::close() {
    {
        std::lock_guard<std::mutex> lock(state->lifecycle_mutex);
        state->closed = true;
    }
    state->service.clear_and_stop();
}

bool ProfilerCommand::execute(const vector<string>& args) {
    ProfilerArguments arguments = ProfilerArguments::parse(args);
    if (!arguments.parsed) {
        for (const auto& error: arguments.errors) {
            state->reply(error);
        }
        return false;
    }

    if (arguments.info) {
        info();
        return true;
    }
    if (arguments.cancel) {
        return cancel();
    }
    if (arguments.stop) {
        return stop(arguments);
    }
    return start(arguments);
}

bool ProfilerCommand::start(const ProfilerArguments& arguments) {
    state->reply("Initializing a new profiler, please wait...");

    ThreadDumper dumper;
    if (arguments.threads.empty()) {
        dumper = default_dumper;
    } else if (std::find(arguments.threads.begin(), arguments.threads.end(), "*") != arguments.threads.end()) {
        dumper = ThreadDumper::all();
    } else if (arguments.regex) {
        dumper = ThreadDumper::regex(arguments.threads);
    } else {
        dumper = ThreadDumper::specific(arguments.threads);
    }

    ThreadGrouper grouper = ThreadGrouper::by_pool();
    if (arguments.combine_all) {
        grouper = ThreadGrouper::as_one();
    } else if (arguments.not_combined) {
        grouper = ThreadGrouper::by_name();
    }

    SamplerConfigBuilder builder;
    builder.dumper(move(dumper))
        .grouper(grouper)
        .sampling_interval(arguments.interval_ms)
        .ignore_sleeping(arguments.ignore_sleeping)
        .ignore_native(arguments.ignore_native)
        .force_fallback_backend(arguments.force_fallback_backend)
        .verbose(arguments.debug);
    if (arguments.timeout_seconds != -1) {
        builder.complete_after(std::chrono::seconds(arguments.timeout_seconds));
    }
    if (arguments.only_ticks_over_ms != -1) {
        builder.minimum_tick_duration(std::chrono::milliseconds(arguments.only_ticks_over_ms));
    }

    auto config = builder.build();
    if (!config.isOk()) {
        state->reply(config.getErrRef());
        return false;
    }

    std::shared_ptr<State> shared = state;
    auto sampler = state->service.create(move(config).getOkRef(), [shared](const string& message) {
        shared->reply(message);
    });
    if (!sampler) {
        return false;
    }

    sampler->start();

    state->reply("Profiler now active! (" + sampler->backend_name() + ")");
    if (arguments.timeout_seconds == -1) {
        state->reply("Use '--stop' to stop profiling and upload the results.");
    } else {
        state->reply("The results will be automatically returned after the profiler has been running for "
            + std::to_string(arguments.timeout_seconds) + " seconds.");
    }

    ReportOptions options = arguments.report_options(state->actor);
    bool save_to_file = arguments.save_to_file;
    bool auto_report = arguments.timeout_seconds != -1;
    std::weak_ptr<Sampler> weak_sampler = sampler;

    sampler->completion().on_complete([shared, weak_sampler, options, save_to_file, auto_report](const CompletionResult& result) {
        std::lock_guard<std::mutex> lock(shared->lifecycle_mutex);
        if (shared->closed) {
            return;
        }
        if (result.outcome == CompletionOutcome::FAILED) {
            shared->reply("Profiler operation failed unexpectedly. Error: " + result.error);
            return;
        }
        if (!result.succeeded() || !auto_report) {
            return;
        }

        auto completed = weak_sampler.lock();
        if (!completed) {
            return;
        }
        // a manual --stop of a timed session handles its own report
        if (!completed->timed_out()) {
            return;
        }

        shared->reply("The active profiler has completed! Uploading results...");
        shared->handle_report(*completed, options, save_to_file);
        shared->service.clear(completed);
    });

    return true;
}

void ProfilerCommand::info() {
    auto active = state->service.active();
    if (!active) {
        state->reply("There isn't an active profiler running.");
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto timeout = active->auto_end_time();
    if (!timeout.has_value()) {
        state->reply("There is an active profiler currently running, with no defined timeout.");
    } else {
        auto remaining = std::chrono::duration_cast<std::chrono::seconds>(*timeout - now).count();
        state->reply("There is an active profiler currently running, due to timeout in " + std::to_string(remaining) + " seconds.");
    }

    auto running = std::chrono::duration_cast<std::chrono::seconds>(now - active->start_time()).count();
    state->reply("It has been profiling for " + std::to_string(running) + " seconds so far ("
        + std::to_string(active->total_samples()) + " samples, " + to_string(active->state()) + ").");
}

bool ProfilerCommand::cancel() {
    if (!state->service.active()) {
        state->reply("There isn't an active profiler running.");
        return false;
    }

    state->service.cancel_active();
    state->reply("The active profiler has been cancelled.");
    return true;
}

bool ProfilerCommand::stop(const ProfilerArguments& arguments) {
    auto sampler = state->service.active();
    if (!sampler) {
        state->reply("There isn't an active profiler running.");
        return false;
    }

    if (!sampler->stop()) {
        state->reply(string("The active profiler is already ") + to_string(sampler->state()) + ".");
        return false;
    }

    state->reply("The active profiler has been stopped! Uploading results...");
    bool handled = state->handle_report(*sampler, arguments.report_options(state->actor), arguments.save_to_file);
    state->service.clear(sampler);
    return handled;
}
