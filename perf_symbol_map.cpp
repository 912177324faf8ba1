#include <fstream>
#include <sstream>
#include <utility>

#include <sys/stat.h>

#include "perf_symbol_map.hpp"

using std::string;

void PerfSymbolMap::maybe_append() {
    struct stat statbuf;
    if (lstat(path.c_str(), &statbuf) != 0) {
        return;
    }

    uint64_t file_size = statbuf.st_size;
    if (file_size < consumed) {
        // the runtime restarted and truncated the map
        symbols.clear();
        consumed = 0;
    }
    if (consumed >= file_size) {
        return;
    }

    std::ifstream in(path.c_str());
    in.seekg(consumed);

    string line;
    while (std::getline(in, line)) {
        if (in.eof()) {
            // unterminated line is still being written
            break;
        }
        consumed += line.size() + 1;

        std::istringstream fields(line);
        uintptr_t offset, length;
        if (!(fields >> std::hex >> offset >> length)) {
            continue;
        }
        fields.ignore(1, ' ');
        string name;
        std::getline(fields, name);
        if (name.empty()) {
            continue;
        }
        symbols[offset] = PerfSymbolInfo { offset, length, string_pool.intern(name) };
    }
}

std::optional<PerfSymbolInfo> PerfSymbolMap::resolve(uintptr_t ip) const {
    auto it = symbols.upper_bound(ip);
    if (it == symbols.begin()) {
        return std::nullopt;
    }
    --it;

    const auto& symbol = it->second;
    if (symbol.offset <= ip && ip < symbol.offset + symbol.length) {
        return symbol;
    }
    return std::nullopt;
}

static string trim(const string& value) {
    size_t begin = value.find_first_not_of(' ');
    if (begin == string::npos) {
        return string();
    }
    size_t end = value.find_last_not_of(' ');
    return value.substr(begin, end - begin + 1);
}

SymbolParts split_symbol(const string& symbol) {
    SymbolParts parts;

    string head = symbol;
    size_t paren = symbol.find('(');
    if (paren != string::npos && paren > 0) {
        head = trim(symbol.substr(0, paren));
        parts.descriptor = symbol.substr(paren);
        size_t close = parts.descriptor.rfind(')');
        if (close != string::npos) {
            parts.descriptor.resize(close + 1);
        }
    }

    size_t scope = head.rfind("::");
    if (scope != string::npos) {
        parts.class_name = head.substr(0, scope);
        parts.method_name = head.substr(scope + 2);
        return parts;
    }

    size_t colon = head.rfind(':');
    if (colon != string::npos) {
        parts.class_name = head.substr(0, colon);
        parts.method_name = head.substr(colon + 1);
        return parts;
    }

    parts.method_name = head;
    return parts;
}
