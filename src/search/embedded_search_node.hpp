//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// search/embedded_search_node.hpp
//
// In-process search node speaking a subset of the Elasticsearch REST API:
//   GET  /                         cluster info
//   PUT  /{index}                  create index with explicit mappings
//   HEAD /{index}                  index exists
//   POST /_bulk                    NDJSON bulk index
//   GET  /{index}/_count           document count
//   POST /{index}/_search?scroll=  open scroll
//   POST /_search/scroll           next scroll page
//   DELETE /_search/scroll         clear scroll
//===----------------------------------------------------------------------===//

#pragma once

#include "http/http_server.hpp"
#include "search/index_store.hpp"
#include "search/search_engine.hpp"
#include <memory>
#include <mutex>

namespace duckes {

class EmbeddedSearchNode : public SearchEngine {
public:
    struct Config {
        std::string host = "127.0.0.1";
        uint16_t port = 0;  // 0 = ephemeral
        std::string cluster_name = "duckes";
    };

    EmbeddedSearchNode();
    explicit EmbeddedSearchNode(const Config& config_p);
    ~EmbeddedSearchNode() override;

    EmbeddedSearchNode(const EmbeddedSearchNode&) = delete;
    EmbeddedSearchNode& operator=(const EmbeddedSearchNode&) = delete;

    void Start() override;
    void Stop() override;
    bool IsRunning() const override;

    std::string GetHost() const override { return config.host; }
    uint16_t GetPort() const override;
    std::string GetBaseUrl() const;

    std::unique_ptr<SearchClient> CreateClient(std::chrono::milliseconds request_timeout) const override;

    IndexStore& GetStore() { return store; }

    // The next `count` requests whose path starts with path_prefix are answered
    // with `status` and not processed
    void InjectFailures(const std::string& path_prefix, int status, size_t count);
    uint64_t GetRequestCount() const;

private:
    HttpResponse Handle(const HttpRequest& request);
    bool TakeInjectedFailure(const std::string& path, int& status);

    HttpResponse HandleInfo();
    HttpResponse HandleCreateIndex(const std::string& index, const HttpRequest& request);
    HttpResponse HandleBulk(const HttpRequest& request);
    HttpResponse HandleCount(const std::string& index);
    HttpResponse HandleSearch(const std::string& index, const HttpRequest& request);
    HttpResponse HandleScroll(const HttpRequest& request);
    HttpResponse HandleClearScroll(const HttpRequest& request);

    static HttpResponse JsonResponse(int status, const Json::Value& body);
    static HttpResponse ErrorResponse(int status, const std::string& type, const std::string& reason);

private:
    struct InjectedFailure {
        std::string path_prefix;
        int status;
        size_t remaining;
    };

    Config config;
    IndexStore store;
    std::unique_ptr<HttpServer> server;

    mutable std::mutex failure_mutex;
    std::vector<InjectedFailure> injected_failures;
};

} // namespace duckes
