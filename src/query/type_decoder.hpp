//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// query/type_decoder.hpp
//
// Resolves type names through a query node's catalog, so aliases
// ("INT8", "DECIMAL(15,2)", user types) decode like they would in SQL
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb.hpp"
#include <memory>
#include <mutex>
#include <parallel_hashmap/phmap.h>
#include <string>

namespace duckes {

class TypeDecoder {
public:
    // The decoder must not outlive the database
    explicit TypeDecoder(duckdb::DatabaseInstance& db);

    // Throws ConfigError for unknown or malformed type names
    duckdb::LogicalType Decode(const std::string& type_name);

    static std::string Encode(const duckdb::LogicalType& type) { return type.ToString(); }

private:
    static bool IsWellFormed(const std::string& type_name);

    std::unique_ptr<duckdb::Connection> connection;
    std::mutex mutex;
    phmap::flat_hash_map<std::string, duckdb::LogicalType> cache;
};

} // namespace duckes
