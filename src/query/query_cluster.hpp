//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// query/query_cluster.hpp
//
// Multi-node query cluster with a coordinator HTTP endpoint
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "connector/catalog_registry.hpp"
#include "http/http_server.hpp"
#include "query/query_node.hpp"

namespace duckes {

class QueryCluster {
public:
    struct Config {
        uint32_t node_count = DEFAULT_NODE_COUNT;
        std::string http_host = "127.0.0.1";
        uint16_t http_port = 0;  // 0 = ephemeral
        ConnectionPool::Config pool;
    };

    explicit QueryCluster(const Config& config_p);
    ~QueryCluster();

    QueryCluster(const QueryCluster&) = delete;
    QueryCluster& operator=(const QueryCluster&) = delete;

    // Starts every node, then the coordinator endpoint. On failure the nodes
    // started so far are closed before the error propagates.
    void Start();
    void Close();
    bool IsRunning() const { return running; }

    size_t GetNodeCount() const { return nodes.size(); }
    QueryNode& GetCoordinator();
    QueryNode& GetNode(size_t index);

    void InstallPlugin(std::shared_ptr<Plugin> plugin);

    // Registers the catalog and attaches it to every node
    void CreateCatalog(const std::string& catalog_name,
                       const std::string& connector_name,
                       const CatalogProperties& properties = {});

    CatalogRegistry& GetCatalogs() { return catalogs; }

    // Session on the coordinator bound to catalog/schema
    SessionPtr CreateSession(const std::string& catalog, const std::string& schema);

    std::string GetBaseUrl() const;

private:
    HttpResponse HandleHttp(const HttpRequest& request);

    Config config;
    std::vector<std::unique_ptr<QueryNode>> nodes;
    CatalogRegistry catalogs;
    std::unique_ptr<HttpServer> http_server;
    bool running = false;
};

} // namespace duckes
