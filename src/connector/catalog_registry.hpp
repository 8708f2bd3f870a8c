//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// connector/catalog_registry.hpp
//
// Installed plugins and the catalogs created over them
//===----------------------------------------------------------------------===//

#pragma once

#include "connector/connector.hpp"
#include "errors/harness_error.hpp"
#include <mutex>
#include <parallel_hashmap/phmap.h>
#include <vector>

namespace duckes {

class CatalogRegistry {
public:
    CatalogRegistry() = default;
    ~CatalogRegistry();

    CatalogRegistry(const CatalogRegistry&) = delete;
    CatalogRegistry& operator=(const CatalogRegistry&) = delete;

    // Throws ConfigError if a plugin with the same connector name exists
    void InstallPlugin(std::shared_ptr<Plugin> plugin);
    bool HasPlugin(const std::string& connector_name) const;

    // Constructs the connector now; throws ConfigError for unknown connectors,
    // duplicate catalogs, or properties the plugin rejects
    Connector& CreateCatalog(const std::string& catalog_name,
                             const std::string& connector_name,
                             const CatalogProperties& properties);

    bool HasCatalog(const std::string& catalog_name) const;
    Connector* GetConnector(const std::string& catalog_name) const;
    const CatalogProperties& GetProperties(const std::string& catalog_name) const;
    std::string GetConnectorName(const std::string& catalog_name) const;

    template<typename T>
    T& GetConnectorAs(const std::string& catalog_name) const {
        auto* typed = dynamic_cast<T*>(GetConnector(catalog_name));
        if (!typed) {
            throw ConfigError("Catalog '" + catalog_name + "' does not exist or has another connector type");
        }
        return *typed;
    }

    // In creation order
    std::vector<std::string> ListCatalogs() const;

    // Shut connectors down in reverse creation order
    void Shutdown();

private:
    struct CatalogEntry {
        std::string connector_name;
        CatalogProperties properties;
        std::unique_ptr<Connector> connector;
    };

    const CatalogEntry& GetEntry(const std::string& catalog_name) const;

    mutable std::mutex mutex;
    phmap::flat_hash_map<std::string, std::shared_ptr<Plugin>> plugins;
    // node_hash_map: entries are referenced from outside the lock
    phmap::node_hash_map<std::string, CatalogEntry> catalogs;
    std::vector<std::string> creation_order;
};

} // namespace duckes
