#pragma once

#include <string>

// Maps a thread name to the logical group its samples are aggregated under.
struct ThreadGrouper {
    enum class Kind {
        BY_NAME,
        BY_POOL,
        AS_ONE,
    };

    static constexpr const char* AS_ONE_KEY = "all";

    Kind kind = Kind::BY_POOL;

    static ThreadGrouper by_name() { return ThreadGrouper { Kind::BY_NAME }; }
    static ThreadGrouper by_pool() { return ThreadGrouper { Kind::BY_POOL }; }
    static ThreadGrouper as_one() { return ThreadGrouper { Kind::AS_ONE }; }

    std::string group_key(const std::string& thread_name) const;

    std::string describe() const;
};

// "Netty IO #3" -> "Netty IO", "Worker-12" -> "Worker". Names without a
// worker index suffix are returned unchanged.
std::string strip_pool_suffix(const std::string& thread_name);
