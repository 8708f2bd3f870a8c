//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// connector/catalog_registry.cpp
//===----------------------------------------------------------------------===//

#include "connector/catalog_registry.hpp"
#include "logging/logger.hpp"

namespace duckes {

CatalogRegistry::~CatalogRegistry() {
    Shutdown();
}

void CatalogRegistry::InstallPlugin(std::shared_ptr<Plugin> plugin) {
    std::string name = plugin->GetConnectorName();

    std::lock_guard<std::mutex> lock(mutex);
    if (plugins.find(name) != plugins.end()) {
        throw ConfigError("Plugin for connector '" + name + "' is already installed");
    }
    plugins.emplace(name, std::move(plugin));
    LOG_INFO("catalogs", "Installed plugin " + name);
}

bool CatalogRegistry::HasPlugin(const std::string& connector_name) const {
    std::lock_guard<std::mutex> lock(mutex);
    return plugins.find(connector_name) != plugins.end();
}

Connector& CatalogRegistry::CreateCatalog(const std::string& catalog_name,
                                          const std::string& connector_name,
                                          const CatalogProperties& properties) {
    std::shared_ptr<Plugin> plugin;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (catalogs.find(catalog_name) != catalogs.end()) {
            throw ConfigError("Catalog '" + catalog_name + "' already exists");
        }
        auto it = plugins.find(connector_name);
        if (it == plugins.end()) {
            throw ConfigError("No plugin installed for connector '" + connector_name + "'");
        }
        plugin = it->second;
    }

    auto connector = plugin->CreateConnector(catalog_name, properties);

    std::lock_guard<std::mutex> lock(mutex);
    CatalogEntry entry;
    entry.connector_name = connector_name;
    entry.properties = properties;
    entry.connector = std::move(connector);
    Connector& created = *entry.connector;
    catalogs.emplace(catalog_name, std::move(entry));
    creation_order.push_back(catalog_name);

    LOG_INFO("catalogs", "Created catalog " + catalog_name + " using connector " + connector_name);
    return created;
}

bool CatalogRegistry::HasCatalog(const std::string& catalog_name) const {
    std::lock_guard<std::mutex> lock(mutex);
    return catalogs.find(catalog_name) != catalogs.end();
}

const CatalogRegistry::CatalogEntry& CatalogRegistry::GetEntry(const std::string& catalog_name) const {
    auto it = catalogs.find(catalog_name);
    if (it == catalogs.end()) {
        throw ConfigError("Catalog '" + catalog_name + "' does not exist");
    }
    return it->second;
}

Connector* CatalogRegistry::GetConnector(const std::string& catalog_name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = catalogs.find(catalog_name);
    return it == catalogs.end() ? nullptr : it->second.connector.get();
}

const CatalogProperties& CatalogRegistry::GetProperties(const std::string& catalog_name) const {
    std::lock_guard<std::mutex> lock(mutex);
    return GetEntry(catalog_name).properties;
}

std::string CatalogRegistry::GetConnectorName(const std::string& catalog_name) const {
    std::lock_guard<std::mutex> lock(mutex);
    return GetEntry(catalog_name).connector_name;
}

std::vector<std::string> CatalogRegistry::ListCatalogs() const {
    std::lock_guard<std::mutex> lock(mutex);
    return creation_order;
}

void CatalogRegistry::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto it = creation_order.rbegin(); it != creation_order.rend(); ++it) {
        auto entry = catalogs.find(*it);
        if (entry == catalogs.end() || !entry->second.connector) {
            continue;
        }
        try {
            entry->second.connector->Shutdown();
        } catch (const std::exception& e) {
            LOG_WARN("catalogs", "Error shutting down catalog " + *it + ": " + e.what());
        }
    }
    catalogs.clear();
    creation_order.clear();
}

} // namespace duckes
