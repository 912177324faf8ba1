#include <re2/re2.h>

#include "thread_grouper.hpp"

using std::string;

string strip_pool_suffix(const string& thread_name) {
    static const re2::RE2 pool_pattern(R"(^(.*?)\s*[-#]\s*\d+$)");

    string pool;
    if (re2::RE2::FullMatch(thread_name, pool_pattern, &pool) && !pool.empty()) {
        return pool;
    }
    return thread_name;
}

string ThreadGrouper::group_key(const string& thread_name) const {
    switch (kind) {
        case Kind::BY_NAME:
            return thread_name;
        case Kind::BY_POOL:
            return strip_pool_suffix(thread_name);
        case Kind::AS_ONE:
            return AS_ONE_KEY;
    }
    return thread_name;
}

string ThreadGrouper::describe() const {
    switch (kind) {
        case Kind::BY_NAME:
            return "by-name";
        case Kind::BY_POOL:
            return "by-pool";
        case Kind::AS_ONE:
            return "as-one";
    }
    return "unknown";
}
