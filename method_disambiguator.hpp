#pragma once

#include <string>
#include <map>
#include <set>
#include <mutex>
#include <utility>

// Produces display names for methods. Overloads are only told apart when two
// or more descriptors have been observed for the same class and method name;
// otherwise the bare method name is used.
class MethodDisambiguator {
public:
    void observe(const std::string& class_name, const std::string& method_name, const std::string& descriptor);

    std::string disambiguate(const std::string& class_name, const std::string& method_name, const std::string& descriptor);

    size_t overload_count(const std::string& class_name, const std::string& method_name) const;

private:
    using MethodKey = std::pair<std::string, std::string>;

    struct MethodEntry {
        std::set<std::string> descriptors;
        // descriptor -> rendered name; cleared whenever a new overload shows up
        std::map<std::string, std::string> rendered;
    };

    mutable std::mutex mutex;
    std::map<MethodKey, MethodEntry> methods;

    MethodEntry& observe_locked(const std::string& class_name, const std::string& method_name, const std::string& descriptor);
};
