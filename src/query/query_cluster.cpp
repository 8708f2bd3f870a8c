//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// query/query_cluster.cpp
//===----------------------------------------------------------------------===//

#include "query/query_cluster.hpp"
#include "errors/harness_error.hpp"
#include "logging/logger.hpp"
#include "search/json_util.hpp"

namespace duckes {

QueryCluster::QueryCluster(const Config& config_p) : config(config_p) {
}

QueryCluster::~QueryCluster() {
    Close();
}

void QueryCluster::Start() {
    if (running) {
        return;
    }
    if (config.node_count == 0) {
        throw BootstrapError("Query cluster needs at least one node");
    }

    try {
        for (uint32_t i = 0; i < config.node_count; ++i) {
            nodes.push_back(std::make_unique<QueryNode>(i, i == 0, config.pool));
        }

        http_server = std::make_unique<HttpServer>(
            config.http_host, config.http_port, "coordinator",
            [this](const HttpRequest& request) { return HandleHttp(request); });
        http_server->Start();
    } catch (...) {
        http_server.reset();
        for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
            (*it)->Close();
        }
        nodes.clear();
        throw;
    }

    running = true;
    LOG_INFO("cluster", "Query cluster started with " + std::to_string(nodes.size()) +
             " nodes at " + GetBaseUrl());
}

void QueryCluster::Close() {
    if (!running && nodes.empty()) {
        return;
    }
    running = false;

    if (http_server) {
        http_server->Stop();
        http_server.reset();
    }
    catalogs.Shutdown();
    for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
        (*it)->Close();
    }
    nodes.clear();
    LOG_INFO("cluster", "Query cluster closed");
}

QueryNode& QueryCluster::GetCoordinator() {
    return GetNode(0);
}

QueryNode& QueryCluster::GetNode(size_t index) {
    if (index >= nodes.size()) {
        throw std::out_of_range("No query node " + std::to_string(index));
    }
    return *nodes[index];
}

void QueryCluster::InstallPlugin(std::shared_ptr<Plugin> plugin) {
    catalogs.InstallPlugin(std::move(plugin));
}

void QueryCluster::CreateCatalog(const std::string& catalog_name,
                                 const std::string& connector_name,
                                 const CatalogProperties& properties) {
    Connector& connector = catalogs.CreateCatalog(catalog_name, connector_name, properties);
    for (auto& node : nodes) {
        connector.Attach(*node);
    }
}

SessionPtr QueryCluster::CreateSession(const std::string& catalog, const std::string& schema) {
    Connector* connector = catalogs.GetConnector(catalog);
    if (!connector) {
        throw ConfigError("Catalog '" + catalog + "' does not exist");
    }
    return GetCoordinator().CreateSession(catalog, schema, connector->IsQueryable());
}

std::string QueryCluster::GetBaseUrl() const {
    return http_server ? http_server->GetBaseUrl() : "";
}

HttpResponse QueryCluster::HandleHttp(const HttpRequest& request) {
    if (request.method != "GET") {
        return {405, "text/plain", "Method Not Allowed"};
    }

    if (request.path == "/") {
        return {200, "text/plain", "DuckES coordinator"};
    }
    if (request.path == "/v1/info") {
        Json::Value info;
        info["coordinator"] = true;
        info["nodes"] = static_cast<Json::UInt>(nodes.size());
        Json::Value catalog_list(Json::arrayValue);
        for (const auto& name : catalogs.ListCatalogs()) {
            Json::Value entry;
            entry["name"] = name;
            entry["connector"] = catalogs.GetConnectorName(name);
            catalog_list.append(entry);
        }
        info["catalogs"] = catalog_list;
        return {200, "application/json", ToCompactJson(info)};
    }

    return {404, "text/plain", "Not Found"};
}

} // namespace duckes
