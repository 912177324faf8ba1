#include <iostream>
#include <utility>

#include "activity_log.hpp"

void ActivityLog::add(Activity activity) {
    if (echo) {
        std::cerr << "[" << activity.timestamp_ms << "] " << activity.actor << " " << activity.category
            << (activity.kind == Activity::Kind::URL ? " uploaded to " : " saved to ") << activity.location << "\n";
    }
    std::lock_guard<std::mutex> lock(mutex);
    log.push_back(std::move(activity));
}

std::vector<Activity> ActivityLog::entries() const {
    std::lock_guard<std::mutex> lock(mutex);
    return log;
}
