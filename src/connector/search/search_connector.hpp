//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// connector/search/search_connector.hpp
//
// Connector exposing search indices as tables through table descriptions
//===----------------------------------------------------------------------===//

#pragma once

#include "connector/connector.hpp"
#include "connector/search/search_connector_config.hpp"
#include "connector/search/table_description.hpp"
#include "search/search_client.hpp"

namespace duckes {

constexpr const char* SEARCH_CONNECTOR = "search";

// Explicit index mapping for a descriptor's columns
Json::Value IndexMappingFor(const TableDescriptor& descriptor);
const char* SearchFieldTypeFor(const duckdb::LogicalType& type);

class SearchConnector : public Connector {
public:
    SearchConnector(std::string catalog_name_p,
                    SearchConnectorConfig config_p,
                    std::shared_ptr<const TableDescriptionProvider> provider_p,
                    std::unique_ptr<SearchClient> client_p);

    const std::string& GetCatalogName() const override { return catalog_name; }
    void Attach(QueryNode& node) override;
    bool IsQueryable() const override { return false; }

    const SearchConnectorConfig& GetConfig() const { return config; }
    const TableDescriptionProvider& GetProvider() const { return *provider; }
    SearchClient& GetClient() { return *client; }

    const TableDescriptor* GetTable(const std::string& schema, const std::string& table) const;
    std::vector<std::string> ListTables(const std::string& schema) const;

    // Creates the descriptor's index with its explicit mapping.
    // Returns false if the index already existed.
    bool CreateIndex(const TableDescriptor& descriptor);

    // Every document of the table's index, read in scroll pages.
    // Throws ConfigError for an unknown table and SearchClientError on failure.
    std::vector<Json::Value> ScanTable(const std::string& schema, const std::string& table);

private:
    std::string catalog_name;
    SearchConnectorConfig config;
    std::shared_ptr<const TableDescriptionProvider> provider;
    std::unique_ptr<SearchClient> client;
};

// Creates connectors over the given descriptors, talking to host:port
class SearchPlugin : public Plugin {
public:
    SearchPlugin(std::shared_ptr<const TableDescriptionProvider> provider_p, std::string host_p, uint16_t port_p);

    std::string GetConnectorName() const override { return SEARCH_CONNECTOR; }

    std::unique_ptr<Connector> CreateConnector(const std::string& catalog_name,
                                               const CatalogProperties& properties) override;

private:
    std::shared_ptr<const TableDescriptionProvider> provider;
    std::string host;
    uint16_t port;
};

} // namespace duckes
