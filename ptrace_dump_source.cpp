#include <string>
#include <utility>
#include <iostream>
#include <fstream>
#include <optional>

#include <libunwind.h>
#include <libunwind-ptrace.h>
#include <cxxabi.h>
#include <stdlib.h>
#include <errno.h>
#include <signal.h>
#include <string.h>
#include <dirent.h>
#include <stdio.h>

#include <sys/ptrace.h>
#include <sys/types.h>
#include <sys/wait.h>

#include "ptrace_dump_source.hpp"

using std::optional;
using std::string;
using std::to_string;
using std::move;
using std::vector;

static Result<optional<ThreadSnapshot>, string> fail(string&& message) {
    return ResultInit::err(move(message));
}

static string errno_message(const string& call) {
    int errno_copy = errno;
    return call + " failed with errno = " + to_string(errno_copy) + " message = " + strerror(errno_copy);
}

class PtraceDetachGuard {
    pid_t pid;
public:
    int stopped_signal = 0;
    PtraceDetachGuard(pid_t pid): pid(pid) {}
    PtraceDetachGuard(const PtraceDetachGuard&) = delete;
    ~PtraceDetachGuard() {
        if (pid) {
            int rc = ptrace(PTRACE_DETACH, pid, 0, stopped_signal);
            if (rc != 0) {
                std::cerr << errno_message("ptrace(PTRACE_DETACH)") << "\n";
            }
            pid = 0;
        }
    }
};

class UnwAddrSpaceGuard {
    unw_addr_space_t data;
public:
    UnwAddrSpaceGuard(unw_addr_space_t data): data(data) {}
    UnwAddrSpaceGuard(const UnwAddrSpaceGuard&) = delete;
    ~UnwAddrSpaceGuard() {
        if (data) {
            unw_destroy_addr_space(data);
            data = nullptr;
        }
    }
};

class UptInfoGuard {
    void* data;
public:
    UptInfoGuard(void* data): data(data) {}
    UptInfoGuard(const UptInfoGuard&) = delete;
    ~UptInfoGuard() {
        if (data) {
            _UPT_destroy(data);
            data = nullptr;
        }
    }
};

Result<vector<pid_t>, string> list_threads(pid_t pid) {
    vector<pid_t> result;

    string task_path = string("/proc/") + to_string(pid) + "/task";
    DIR* task_dir = opendir(task_path.c_str());

    if (task_dir) {
        struct dirent* entry;
        while ((entry = readdir(task_dir)) != nullptr) {
            if (entry->d_name[0] == '.') {
                continue;
            }

            pid_t tid = atoi(entry->d_name);
            if (tid != 0) {
                result.push_back(tid);
            }
        }

        closedir(task_dir);
    } else if (errno != ENOENT) {
        return ResultInit::err(errno_message("opendir(" + task_path + ")"));
    }

    return ResultInit::ok(move(result));
}

optional<ThreadStatus> read_thread_status(pid_t tid) {
    string stat_path = string("/proc/") + to_string(tid) + "/stat";
    std::ifstream stat_stream(stat_path.c_str());
    string stat;
    if (!getline(stat_stream, stat)) {
        return std::nullopt;
    }

    // "<tid> (<comm>) <state> ...", comm may itself contain parentheses
    size_t open = stat.find('(');
    size_t close = stat.rfind(')');
    if (open == string::npos || close == string::npos || close < open || close + 2 >= stat.size()) {
        return std::nullopt;
    }

    ThreadStatus status;
    status.state = stat[close + 2];

    // /proc/<tid>/comm is not truncated by ')' handling and matches what tools show
    string comm_path = string("/proc/") + to_string(tid) + "/comm";
    std::ifstream comm_stream(comm_path.c_str());
    if (!getline(comm_stream, status.name)) {
        status.name = stat.substr(open + 1, close - open - 1);
    }
    return status;
}

StackFrame PtraceThreadDumpSource::frame_for(uint64_t name_id, bool native) {
    auto it = frame_cache.find(name_id);
    if (it != frame_cache.end()) {
        return it->second;
    }

    string symbol(string_pool.get_by_id(name_id));
    if (native) {
        int status = 0;
        char* demangled = abi::__cxa_demangle(symbol.c_str(), nullptr, nullptr, &status);
        if (status == 0 && demangled != nullptr) {
            symbol = demangled;
        }
        free(demangled);
    }

    SymbolParts parts = split_symbol(symbol);
    StackFrame frame;
    frame.class_name = move(parts.class_name);
    frame.method_name = move(parts.method_name);
    frame.descriptor = move(parts.descriptor);
    frame.native = native;

    frame_cache.emplace(name_id, frame);
    return frame;
}

Result<optional<ThreadSnapshot>, string> PtraceThreadDumpSource::sample_thread(pid_t target_tid) {
    // state has to be read before the thread is put into a ptrace stop
    auto status = read_thread_status(target_tid);
    if (!status.has_value()) {
        return ResultInit::ok(optional<ThreadSnapshot>());
    }

    int rc = ptrace(PTRACE_SEIZE, target_tid, 0, 0);
    if (rc != 0) {
        if (errno == ESRCH) {
            // LWP does not exist
            return ResultInit::ok(optional<ThreadSnapshot>());
        }

        return fail(errno_message("ptrace(PTRACE_SEIZE)"));
    }

    PtraceDetachGuard ptrace_detach_guard(target_tid);

    rc = ptrace(PTRACE_INTERRUPT, target_tid, 0, 0);
    if (rc != 0) {
        return fail(errno_message("ptrace(PTRACE_INTERRUPT)"));
    }

    {
        int wait_status;
        pid_t tmp = waitpid(target_tid, &wait_status, __WALL);
        if (tmp != target_tid) {
            return fail(errno_message("waitpid() returned " + to_string(tmp) + ";"));
        }

        if (!WIFSTOPPED(wait_status)) {
            return fail("waitpid() returned bad status: !WIFSTOPPED(status); status = " + to_string(wait_status));
        }

        if (WSTOPSIG(wait_status) != SIGTRAP) {
            // signal-delivery-stop: hand the signal back on detach
            ptrace_detach_guard.stopped_signal = WSTOPSIG(wait_status);
        }
    }

    unw_addr_space_t address_space = unw_create_addr_space(&_UPT_accessors, 0);
    if (address_space == nullptr) {
        return fail("unw_create_addr_space() failed");
    }
    UnwAddrSpaceGuard address_space_guard(address_space);

    void* unw_ptrace_cb = _UPT_create(target_tid);
    if (unw_ptrace_cb == nullptr) {
        return fail("_UPT_create() failed");
    }
    UptInfoGuard unw_ptrace_cb_guard(unw_ptrace_cb);

    unw_cursor_t cursor;
    rc = unw_init_remote(&cursor, address_space, unw_ptrace_cb);
    if (rc < 0) {
        return fail("unw_init_remote() failed with ret = " + to_string(rc));
    }

    ThreadSnapshot snapshot;
    snapshot.tid = target_tid;
    snapshot.name = move(status->name);
    snapshot.state = status->state;

    while (snapshot.frames.size() < MAX_STACK_DEPTH) {
        unw_word_t ip;
        rc = unw_get_reg(&cursor, UNW_REG_IP, &ip);
        if (rc < 0) {
            return fail("unw_get_reg(UNW_REG_IP) failed with ret = " + to_string(rc));
        }

        auto symbol = symbol_map.resolve(ip);
        if (symbol.has_value()) {
            snapshot.frames.push_back(frame_for(symbol->name_id, false));
        } else {
            unw_word_t ip_offset;
            char buf[1024];

            rc = unw_get_proc_name(&cursor, &buf[0], sizeof(buf), &ip_offset);
            if (rc == 0 || rc == -UNW_ENOMEM) {
                snapshot.frames.push_back(frame_for(string_pool.intern(std::string_view(buf)), true));
            } else {
                char address[32];
                snprintf(address, sizeof(address), "0x%lx", (unsigned long) ip);
                StackFrame frame;
                frame.method_name = address;
                frame.native = true;
                snapshot.frames.push_back(move(frame));
            }
        }

        rc = unw_step(&cursor);
        if (rc <= 0) {
            // 0 is the end of the call chain; a failed step keeps what was unwound so far
            break;
        }
    }

    return ResultInit::ok(optional<ThreadSnapshot>(move(snapshot)));
}

Result<vector<ThreadSnapshot>, string> PtraceThreadDumpSource::dump() {
    symbol_map.maybe_append();

    auto threads_result = list_threads(pid);
    if (!threads_result.isOk()) {
        return ResultInit::err(string(threads_result.getErrRef()));
    }

    vector<ThreadSnapshot> snapshots;
    for (pid_t tid: threads_result.getOkRef()) {
        auto thread_result = sample_thread(tid);
        if (!thread_result.isOk()) {
            return ResultInit::err(
                string("Tracing thread ") + to_string(tid) + " failed: " + move(thread_result).getErrRef());
        }
        if (thread_result.getOkRef().has_value()) {
            snapshots.push_back(move(thread_result).getOkRef().value());
        }
    }

    return ResultInit::ok(move(snapshots));
}
