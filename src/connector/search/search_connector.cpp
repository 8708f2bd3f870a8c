//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// connector/search/search_connector.cpp
//===----------------------------------------------------------------------===//

#include "connector/search/search_connector.hpp"
#include "errors/harness_error.hpp"
#include "logging/logger.hpp"
#include "query/query_node.hpp"

namespace duckes {

const char* SearchFieldTypeFor(const duckdb::LogicalType& type) {
    using duckdb::LogicalTypeId;
    switch (type.id()) {
    case LogicalTypeId::BOOLEAN:
        return "boolean";
    case LogicalTypeId::TINYINT:
    case LogicalTypeId::SMALLINT:
    case LogicalTypeId::INTEGER:
    case LogicalTypeId::BIGINT:
    case LogicalTypeId::UTINYINT:
    case LogicalTypeId::USMALLINT:
    case LogicalTypeId::UINTEGER:
        return "long";
    case LogicalTypeId::FLOAT:
    case LogicalTypeId::DOUBLE:
    case LogicalTypeId::DECIMAL:
        return "double";
    case LogicalTypeId::DATE:
    case LogicalTypeId::TIMESTAMP:
    case LogicalTypeId::TIMESTAMP_TZ:
    case LogicalTypeId::TIMESTAMP_MS:
    case LogicalTypeId::TIMESTAMP_SEC:
    case LogicalTypeId::TIMESTAMP_NS:
        return "date";
    default:
        return "keyword";
    }
}

Json::Value IndexMappingFor(const TableDescriptor& descriptor) {
    Json::Value properties(Json::objectValue);
    for (const auto& column : descriptor.GetColumns()) {
        properties[column.name]["type"] = SearchFieldTypeFor(column.type);
    }
    return properties;
}

//===----------------------------------------------------------------------===//
// SearchConnector
//===----------------------------------------------------------------------===//

SearchConnector::SearchConnector(std::string catalog_name_p,
                                 SearchConnectorConfig config_p,
                                 std::shared_ptr<const TableDescriptionProvider> provider_p,
                                 std::unique_ptr<SearchClient> client_p)
    : catalog_name(std::move(catalog_name_p))
    , config(std::move(config_p))
    , provider(std::move(provider_p))
    , client(std::move(client_p)) {
}

void SearchConnector::Attach(QueryNode& node) {
    // Search tables are read through ScanTable, nothing is attached to DuckDB
    LOG_DEBUG("search_connector", "Catalog " + catalog_name + " registered on " + node.GetName() +
              " with " + std::to_string(provider->Size()) + " tables");
}

const TableDescriptor* SearchConnector::GetTable(const std::string& schema, const std::string& table) const {
    return provider->Get(schema, table);
}

std::vector<std::string> SearchConnector::ListTables(const std::string& schema) const {
    return provider->ListTables(schema);
}

bool SearchConnector::CreateIndex(const TableDescriptor& descriptor) {
    bool created = client->CreateIndex(descriptor.GetIndexName(), IndexMappingFor(descriptor));
    if (created) {
        LOG_DEBUG("search_connector", "Created index " + descriptor.GetIndexName());
    }
    return created;
}

std::vector<Json::Value> SearchConnector::ScanTable(const std::string& schema, const std::string& table) {
    const TableDescriptor* descriptor = provider->Get(schema, table);
    if (!descriptor) {
        throw ConfigError("Table " + catalog_name + "." + schema + "." + table + " does not exist");
    }

    std::vector<Json::Value> documents;
    SearchPage page = client->StartScroll(descriptor->GetIndexName(), config.scroll_size, config.scroll_timeout);
    std::string scroll_id = page.scroll_id;
    try {
        while (!page.documents.empty()) {
            for (auto& document : page.documents) {
                documents.push_back(std::move(document));
            }
            page = client->ContinueScroll(scroll_id, config.scroll_timeout);
            if (!page.scroll_id.empty()) {
                scroll_id = page.scroll_id;
            }
        }
    } catch (const std::exception&) {
        try {
            client->ClearScroll(scroll_id);
        } catch (const std::exception& clear_error) {
            LOG_WARN("search_connector", "Failed to clear scroll: " + std::string(clear_error.what()));
        }
        throw;
    }
    client->ClearScroll(scroll_id);
    return documents;
}

//===----------------------------------------------------------------------===//
// SearchPlugin
//===----------------------------------------------------------------------===//

SearchPlugin::SearchPlugin(std::shared_ptr<const TableDescriptionProvider> provider_p,
                           std::string host_p, uint16_t port_p)
    : provider(std::move(provider_p))
    , host(std::move(host_p))
    , port(port_p) {
}

std::unique_ptr<Connector> SearchPlugin::CreateConnector(const std::string& catalog_name,
                                                         const CatalogProperties& properties) {
    auto config = SearchConnectorConfig::FromProperties(properties);
    auto client = std::make_unique<SearchClient>(host, port, config.request_timeout);
    return std::make_unique<SearchConnector>(catalog_name, std::move(config), provider, std::move(client));
}

} // namespace duckes
