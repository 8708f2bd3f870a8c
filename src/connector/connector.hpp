//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// connector/connector.hpp
//
// Plugin and connector interfaces
//===----------------------------------------------------------------------===//

#pragma once

#include <map>
#include <memory>
#include <string>

namespace duckes {

class QueryNode;

using CatalogProperties = std::map<std::string, std::string>;

// A configured data source behind one catalog
class Connector {
public:
    virtual ~Connector() = default;

    virtual const std::string& GetCatalogName() const = 0;

    // Make the catalog visible on a query node. Called once per node.
    virtual void Attach(QueryNode& node) = 0;

    // True when the catalog is a database sessions can bind to with USE
    virtual bool IsQueryable() const = 0;

    virtual void Shutdown() {}
};

// Factory of connectors, installed once and referenced by name
class Plugin {
public:
    virtual ~Plugin() = default;

    virtual std::string GetConnectorName() const = 0;

    // Throws ConfigError on invalid properties
    virtual std::unique_ptr<Connector> CreateConnector(const std::string& catalog_name,
                                                       const CatalogProperties& properties) = 0;
};

} // namespace duckes
