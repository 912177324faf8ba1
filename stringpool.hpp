#pragma once

#include <stdint.h>
#include <vector>
#include <string>
#include <unordered_map>
#include <string_view>
#include <memory>
#include <utility>
#include <shared_mutex>
#include <mutex>

// Append-only interner. Ids stay valid for the lifetime of the pool and the
// returned views point into heap storage that never moves.
struct StringPool {
    mutable std::shared_mutex mutex;
    std::vector<std::unique_ptr<std::string>> strings;
    std::unordered_map<std::string_view, uint64_t> map;

    uint64_t intern(std::string_view data) {
        std::shared_lock<std::shared_mutex> shared_lock(mutex);
        auto it = map.find(data);
        if (it != map.end()) {
            return it->second;
        }
        shared_lock.unlock();

        std::unique_lock<std::shared_mutex> unique_lock(mutex);
        it = map.find(data);
        if (it != map.end()) {
            return it->second;
        }

        uint64_t new_id = strings.size();
        strings.push_back(std::make_unique<std::string>(data));
        // key must view the pooled copy, not the caller's buffer
        map.emplace(std::string_view(*strings.back()), new_id);
        return new_id;
    }

    std::string_view get_by_id(uint64_t name_id) const {
        std::shared_lock<std::shared_mutex> shared_lock(mutex);
        return *strings.at(name_id);
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> shared_lock(mutex);
        return strings.size();
    }
};
