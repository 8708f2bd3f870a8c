//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// search/search_engine.hpp
//
// Lifecycle of the search engine the runner seeds
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace duckes {

class SearchClient;

class SearchEngine {
public:
    virtual ~SearchEngine() = default;

    // Must be reachable once Start() returns; throws on failure
    virtual void Start() = 0;
    // Idempotent
    virtual void Stop() = 0;
    virtual bool IsRunning() const = 0;

    virtual std::string GetHost() const = 0;
    virtual uint16_t GetPort() const = 0;

    virtual std::unique_ptr<SearchClient> CreateClient(std::chrono::milliseconds request_timeout) const = 0;
};

} // namespace duckes
