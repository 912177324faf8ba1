#include <iostream>
#include <vector>
#include <string>
#include <chrono>
#include <thread>

#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include "activity_log.hpp"
#include "profiler_command.hpp"
#include "profiler_service.hpp"
#include "ptrace_dump_source.hpp"
#include "report_handler.hpp"

#define PROJECT_NAME "stackprof"

using std::cerr;
using std::cout;
using std::vector;
using std::string;

static volatile sig_atomic_t interrupted = 0;

static void on_interrupt(int) {
    interrupted = 1;
}

struct CliArguments {
    bool parsed;
    pid_t pid;
    string output_dir;
    // Everything not consumed here is handed to the profiler command.
    vector<string> profiler_args;

    static CliArguments parse(int argc, char** argv) {
        vector<string> args { &argv[1], &argv[argc] };

        bool parsed = true;
        pid_t pid = 0;
        string output_dir = ".";
        vector<string> profiler_args;

        for (auto it = args.begin(); it != args.end(); ++it) {
            if (*it == "--pid" || *it == "--output-dir") {
                const string flag = *it;
                if (it + 1 == args.end()) {
                    cerr << flag << " requires a value\n";
                    parsed = false;
                    break;
                }
                ++it;
                if (flag == "--pid") {
                    pid = atol(it->c_str());
                } else {
                    output_dir = *it;
                }
            } else {
                profiler_args.push_back(*it);
            }
        }

        if (pid <= 0) {
            cerr << "--pid must be specified and > 0\n";
            parsed = false;
        }

        return CliArguments {
            parsed,
            pid,
            output_dir,
            profiler_args
        };
    }
};

static string current_actor() {
    const char* user = getenv("USER");
    return user != nullptr && *user != '\0' ? string(user) : string("console");
}

// Waits for a line on stdin, giving up after timeout_ms. Returns 1 when a
// line is ready, 0 on timeout, -1 on EOF or error.
static int wait_for_input(int timeout_ms) {
    struct pollfd fd { STDIN_FILENO, POLLIN, 0 };
    int rc = poll(&fd, 1, timeout_ms);
    if (rc < 0) {
        return errno == EINTR ? 0 : -1;
    }
    if (rc == 0) {
        return 0;
    }
    return (fd.revents & (POLLIN | POLLHUP)) ? 1 : -1;
}

int main(int argc, char **argv) {
    auto cli_args = CliArguments::parse(argc, argv);
    if (!cli_args.parsed) {
        cerr << "Usage: " PROJECT_NAME " --pid PID [--output-dir DIR] [--interval MS] [--thread NAME]... [--regex]\n"
                "       [--timeout SEC] [--combine-all|--not-combined] [--force-fallback-backend]\n"
                "       [--ignore-sleeping] [--ignore-native] [--comment TEXT] [--order-by-time]\n"
                "       [--merge-parent-calls] [--debug]\n"
                "Further commands (--info, --stop, --cancel, ...) are read from stdin.\n";
        return 1;
    }

    struct sigaction action {};
    action.sa_handler = on_interrupt;
    sigemptyset(&action.sa_mask);
    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        cerr << "sigaction() failed: " << strerror(errno) << "\n";
        return 1;
    }

    PtraceThreadDumpSource source(cli_args.pid);
    ProfilerService service(source);
    ActivityLog activity_log(true);
    // no upload transport is built in: reports go to disk
    ReportHandler handler(nullptr, activity_log, cli_args.output_dir);

    pid_t target = cli_args.pid;
    ThreadDumper main_thread = ThreadDumper::host_default("main thread", [target](const ThreadSnapshot& thread) {
        return thread.tid == target;
    });

    ProfilerCommand command(service, main_thread, handler, cout, current_actor());

    cerr << "Profiling pid " << cli_args.pid << "\n";
    if (!command.execute(cli_args.profiler_args)) {
        return 1;
    }

    bool stdin_open = true;
    while (service.active()) {
        if (interrupted) {
            interrupted = 0;
            command.execute({ "--stop" });
            continue;
        }

        if (!stdin_open) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        int ready = wait_for_input(100);
        if (ready == 0) {
            continue;
        }

        string line;
        if (ready < 0 || !std::getline(std::cin, line)) {
            stdin_open = false;
            auto active = service.active();
            if (active && !active->auto_end_time().has_value()) {
                // nothing else can end an open-ended session
                command.execute({ "--stop" });
            }
            continue;
        }

        auto words = split_command_line(line);
        if (!words.empty()) {
            command.execute(words);
        }
    }

    return 0;
}
