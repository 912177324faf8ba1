#pragma once

#include <stdint.h>
#include <string>
#include <map>
#include <optional>
#include <utility>

#include <sys/types.h>

#include "stringpool.hpp"

struct PerfSymbolInfo {
    uintptr_t offset;
    uintptr_t length;
    uint64_t name_id;
};

// Incremental reader of the /tmp/perf-<pid>.map file JIT runtimes append
// their generated code ranges to.
struct PerfSymbolMap {
    StringPool& string_pool;
    std::string path;
    // Bytes of complete lines consumed so far.
    uint64_t consumed = 0;
    std::map<uintptr_t, PerfSymbolInfo> symbols;

    PerfSymbolMap(StringPool& string_pool, pid_t pid)
        : string_pool(string_pool), path(std::string("/tmp/perf-") + std::to_string(pid) + ".map") {}

    PerfSymbolMap(StringPool& string_pool, std::string path)
        : string_pool(string_pool), path(std::move(path)) {}

    // Picks up lines appended since the last call. A missing file is not an error.
    void maybe_append();

    std::optional<PerfSymbolInfo> resolve(uintptr_t ip) const;
};

struct SymbolParts {
    std::string class_name;
    std::string method_name;
    std::string descriptor;
};

// Splits "Namespace.Class:Method (int,string)" (managed runtimes) or
// "ns::Class::method(int)" (demangled C++) into class, method and parameter list.
SymbolParts split_symbol(const std::string& symbol);
