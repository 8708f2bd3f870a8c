//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// connector/tpch/tpch_plugin.hpp
//
// Benchmark data source: TPC-H tables generated by DuckDB's dbgen into an
// in-memory database attached under the catalog name
//===----------------------------------------------------------------------===//

#pragma once

#include "connector/connector.hpp"
#include <string>
#include <vector>

namespace duckes {

constexpr const char* TPCH_CONNECTOR = "tpch";
constexpr double TPCH_TINY_SCALE_FACTOR = 0.01;

// region, nation, supplier, customer, part, partsupp, orders, lineitem
const std::vector<std::string>& TpchTables();
bool IsTpchTable(const std::string& name);

class TpchConnector : public Connector {
public:
    TpchConnector(std::string catalog_name_p, double scale_factor_p);

    const std::string& GetCatalogName() const override { return catalog_name; }
    void Attach(QueryNode& node) override;
    bool IsQueryable() const override { return true; }

    double GetScaleFactor() const { return scale_factor; }

private:
    std::string catalog_name;
    double scale_factor;
};

class TpchPlugin : public Plugin {
public:
    std::string GetConnectorName() const override { return TPCH_CONNECTOR; }

    // Accepts an optional "tpch.scale-factor" property
    std::unique_ptr<Connector> CreateConnector(const std::string& catalog_name,
                                               const CatalogProperties& properties) override;
};

} // namespace duckes
