#pragma once

#include <stdint.h>
#include <mutex>
#include <string>
#include <vector>

struct Activity {
    enum class Kind {
        URL,
        FILE,
    };

    std::string actor;
    int64_t timestamp_ms = 0;
    std::string category;
    Kind kind = Kind::FILE;
    // URL or file path, depending on kind.
    std::string location;
};

// Record of shared results. Adding never fails and never blocks on I/O
// beyond an optional stderr echo.
class ActivityLog {
public:
    explicit ActivityLog(bool echo = false) : echo(echo) {}

    void add(Activity activity);

    std::vector<Activity> entries() const;

private:
    bool echo;
    mutable std::mutex mutex;
    std::vector<Activity> log;
};
