//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// runner/resource_guard.hpp
//
// Releases acquired resources in reverse order of acquisition
//===----------------------------------------------------------------------===//

#pragma once

#include "logging/logger.hpp"
#include <functional>
#include <string>
#include <vector>

namespace duckes {

class ResourceGuard {
public:
    ResourceGuard() = default;
    ~ResourceGuard() { ReleaseAll(); }

    ResourceGuard(const ResourceGuard&) = delete;
    ResourceGuard& operator=(const ResourceGuard&) = delete;

    void Push(std::string name, std::function<void()> release) {
        entries_.push_back(Entry{std::move(name), std::move(release)});
    }

    // Release errors are logged and do not stop the remaining releases.
    // Returns the number of releases that failed.
    size_t ReleaseAll() {
        size_t failures = 0;
        while (!entries_.empty()) {
            Entry entry = std::move(entries_.back());
            entries_.pop_back();
            try {
                entry.release();
                LOG_DEBUG("resource_guard", "Released " + entry.name);
            } catch (const std::exception& e) {
                failures++;
                LOG_WARN("resource_guard", "Failed to release " + entry.name + ": " + e.what());
            }
        }
        return failures;
    }

    size_t Size() const { return entries_.size(); }

private:
    struct Entry {
        std::string name;
        std::function<void()> release;
    };

    std::vector<Entry> entries_;
};

} // namespace duckes
