//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// connector/search/table_description.hpp
//
// Table-to-index descriptors read from a directory of JSON documents:
//
//   {
//     "tableName": "orders",
//     "schemaName": "tpch",        (optional, defaults to the catalog's schema)
//     "index": "orders",           (optional, must be the lower-cased table name)
//     "columns": [ { "name": "orderkey", "type": "BIGINT" } ]
//   }
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb.hpp"
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace duckes {

class TypeDecoder;
struct SearchConnectorConfig;

struct ColumnDescriptor {
    std::string name;
    duckdb::LogicalType type;
};

class TableDescriptor {
public:
    TableDescriptor(std::string schema_name_p, std::string table_name_p,
                    std::vector<ColumnDescriptor> columns_p);

    const std::string& GetSchemaName() const { return schema_name; }
    const std::string& GetTableName() const { return table_name; }
    const std::string& GetIndexName() const { return index_name; }
    const std::vector<ColumnDescriptor>& GetColumns() const { return columns; }

    static std::string IndexNameFor(const std::string& table_name);

private:
    std::string schema_name;
    std::string table_name;
    std::string index_name;
    std::vector<ColumnDescriptor> columns;
};

// Throws ConfigError. `source` names the document in error messages.
TableDescriptor DecodeTableDescription(const std::string& json_text,
                                       const std::string& default_schema,
                                       TypeDecoder& decoder,
                                       const std::string& source = "<inline>");

class TableDescriptionProvider {
public:
    // Throws ConfigError on duplicate (schema, table)
    explicit TableDescriptionProvider(std::vector<TableDescriptor> descriptors);

    // Exact match, case as stored. Returns nullptr when unknown.
    const TableDescriptor* Get(const std::string& schema, const std::string& table) const;

    std::vector<std::string> ListTables(const std::string& schema) const;
    std::vector<const TableDescriptor*> GetAll() const;
    size_t Size() const { return descriptors.size(); }

private:
    std::map<std::pair<std::string, std::string>, TableDescriptor> descriptors;
};

// "file:///abs/dir", "file:relative" or a plain path. Throws ConfigError for
// other schemes or when the result is not a directory.
std::string ResolveDescriptionDirectory(const std::string& location);

// Decodes every *.json document of the configured directory
std::shared_ptr<const TableDescriptionProvider> ResolveTableDescriptions(const SearchConnectorConfig& config,
                                                                         TypeDecoder& decoder);

} // namespace duckes
