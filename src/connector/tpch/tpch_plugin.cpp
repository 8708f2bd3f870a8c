//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// connector/tpch/tpch_plugin.cpp
//===----------------------------------------------------------------------===//

#include "connector/tpch/tpch_plugin.hpp"
#include "errors/harness_error.hpp"
#include "logging/logger.hpp"
#include "query/query_node.hpp"
#include "duckdb/parser/keyword_helper.hpp"
#include <algorithm>

namespace duckes {

const std::vector<std::string>& TpchTables() {
    static const std::vector<std::string> tables = {
        "region", "nation", "supplier", "customer", "part", "partsupp", "orders", "lineitem"};
    return tables;
}

bool IsTpchTable(const std::string& name) {
    const auto& tables = TpchTables();
    return std::find(tables.begin(), tables.end(), name) != tables.end();
}

TpchConnector::TpchConnector(std::string catalog_name_p, double scale_factor_p)
    : catalog_name(std::move(catalog_name_p))
    , scale_factor(scale_factor_p) {
}

void TpchConnector::Attach(QueryNode& node) {
    auto start = Clock::now();
    std::string catalog = duckdb::KeywordHelper::WriteOptionallyQuoted(catalog_name);

    node.ExecuteStatement("LOAD tpch");
    node.ExecuteStatement("ATTACH ':memory:' AS " + catalog);
    node.ExecuteStatement("CREATE SCHEMA " + catalog + "." + TPCH_TINY_SCHEMA);
    node.ExecuteStatement("CALL dbgen(sf = " + std::to_string(scale_factor) +
                          ", catalog = " + duckdb::KeywordHelper::WriteQuoted(catalog_name, '\'') +
                          ", schema = '" + TPCH_TINY_SCHEMA + "')");

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    LOG_DEBUG("tpch", "Generated " + catalog_name + "." + TPCH_TINY_SCHEMA + " on " + node.GetName() +
              " in " + std::to_string(elapsed.count()) + "ms");
}

std::unique_ptr<Connector> TpchPlugin::CreateConnector(const std::string& catalog_name,
                                                       const CatalogProperties& properties) {
    double scale_factor = TPCH_TINY_SCALE_FACTOR;
    for (const auto& property : properties) {
        if (property.first != "tpch.scale-factor") {
            throw ConfigError("Unknown property '" + property.first + "' for catalog " + catalog_name);
        }
        try {
            scale_factor = std::stod(property.second);
        } catch (const std::exception&) {
            throw ConfigError("Invalid tpch.scale-factor '" + property.second + "'");
        }
        if (scale_factor <= 0) {
            throw ConfigError("tpch.scale-factor must be positive");
        }
    }
    return std::make_unique<TpchConnector>(catalog_name, scale_factor);
}

} // namespace duckes
