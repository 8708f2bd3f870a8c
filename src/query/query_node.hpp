//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// query/query_node.hpp
//
// One node of the query cluster: a DuckDB instance and its connection pool
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "query/type_decoder.hpp"
#include "session/connection_pool.hpp"
#include "session/session.hpp"
#include "duckdb.hpp"

namespace duckes {

class QueryNode {
public:
    QueryNode(uint32_t node_id_p, bool coordinator_p,
              const ConnectionPool::Config& pool_config = ConnectionPool::Config{});
    ~QueryNode();

    QueryNode(const QueryNode&) = delete;
    QueryNode& operator=(const QueryNode&) = delete;

    uint32_t GetNodeId() const { return node_id; }
    bool IsCoordinator() const { return coordinator; }
    std::string GetName() const;

    duckdb::DuckDB& GetDatabase() { return *db; }
    ConnectionPool& GetConnectionPool() { return *connection_pool; }

    SessionPtr CreateSession(const std::string& catalog, const std::string& schema, bool bind_database);

    // Run a statement on a pooled connection. Throws QueryError.
    void ExecuteStatement(const std::string& sql);

    // Metadata service: type names resolved against this node's catalog
    TypeDecoder& GetTypeDecoder();

    uint64_t GetTotalSessionsCreated() const { return next_session_id - 1; }

    void Close();

private:
    uint32_t node_id;
    bool coordinator;
    std::shared_ptr<duckdb::DuckDB> db;
    std::unique_ptr<ConnectionPool> connection_pool;
    std::unique_ptr<TypeDecoder> type_decoder;
    std::mutex decoder_mutex;
    std::atomic<uint64_t> next_session_id{1};
};

} // namespace duckes
