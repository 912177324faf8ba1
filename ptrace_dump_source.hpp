#pragma once

#include <stdint.h>
#include <sys/types.h>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "perf_symbol_map.hpp"
#include "result.hpp"
#include "stringpool.hpp"
#include "thread_dump.hpp"

struct ThreadStatus {
    std::string name;
    char state;
};

// Thread ids of a process, from /proc/<pid>/task. A process that is gone
// yields an empty list.
Result<std::vector<pid_t>, std::string> list_threads(pid_t pid);

// Name and scheduler state of a thread, or nullopt if it no longer exists.
std::optional<ThreadStatus> read_thread_status(pid_t tid);

// Samples the threads of another process: each thread is briefly stopped
// with ptrace and unwound remotely with libunwind. JIT frames are resolved
// through the runtime's perf map; everything else is reported as native.
class PtraceThreadDumpSource : public ThreadDumpSource {
public:
    static constexpr size_t MAX_STACK_DEPTH = 256;

    explicit PtraceThreadDumpSource(pid_t pid) : pid(pid), symbol_map(string_pool, pid) {}

    Result<std::vector<ThreadSnapshot>, std::string> dump() override;

    Result<std::optional<ThreadSnapshot>, std::string> sample_thread(pid_t tid);

private:
    pid_t pid;
    StringPool string_pool;
    PerfSymbolMap symbol_map;
    // Parsed frames by interned symbol id.
    std::unordered_map<uint64_t, StackFrame> frame_cache;

    StackFrame frame_for(uint64_t name_id, bool native);
};
