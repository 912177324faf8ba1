#include "method_disambiguator.hpp"

using std::string;

MethodDisambiguator::MethodEntry& MethodDisambiguator::observe_locked(const string& class_name, const string& method_name, const string& descriptor) {
    MethodEntry& entry = methods[MethodKey(class_name, method_name)];
    if (entry.descriptors.insert(descriptor).second) {
        entry.rendered.clear();
    }
    return entry;
}

void MethodDisambiguator::observe(const string& class_name, const string& method_name, const string& descriptor) {
    std::lock_guard<std::mutex> lock(mutex);
    observe_locked(class_name, method_name, descriptor);
}

string MethodDisambiguator::disambiguate(const string& class_name, const string& method_name, const string& descriptor) {
    std::lock_guard<std::mutex> lock(mutex);
    MethodEntry& entry = observe_locked(class_name, method_name, descriptor);

    auto it = entry.rendered.find(descriptor);
    if (it != entry.rendered.end()) {
        return it->second;
    }

    string display = method_name;
    if (entry.descriptors.size() > 1) {
        if (descriptor.empty()) {
            display += "()";
        } else if (descriptor.front() == '(') {
            display += descriptor;
        } else {
            display += "(" + descriptor + ")";
        }
    }

    entry.rendered.emplace(descriptor, display);
    return display;
}

size_t MethodDisambiguator::overload_count(const string& class_name, const string& method_name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = methods.find(MethodKey(class_name, method_name));
    return it == methods.end() ? 0 : it->second.descriptors.size();
}
