//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// session/session.hpp
//
// Client session bound to a catalog and schema
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "session/connection_pool.hpp"
#include "duckdb.hpp"
#include <stdexcept>

namespace duckes {

// Query failed to parse, bind or execute
class QueryError : public std::runtime_error {
public:
    explicit QueryError(const std::string& message) : std::runtime_error(message) {}
};

class Session {
public:
    using Ptr = std::shared_ptr<Session>;

    // bind_database: issue "USE catalog.schema" on the connection. Catalogs that
    // are not backed by a DuckDB database only carry the names.
    Session(uint64_t session_id_p, ConnectionPool* pool_p,
            std::string catalog_p, std::string schema_p, bool bind_database_p);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    uint64_t GetSessionId() const { return session_id; }
    const std::string& GetCatalog() const { return catalog; }
    const std::string& GetSchema() const { return schema; }
    TimePoint GetCreatedAt() const { return created_at; }

    // Acquires from the pool on first use and keeps it until ReleaseConnection()
    duckdb::Connection& GetConnection();
    void ReleaseConnection();
    bool HasActiveConnection() const { return static_cast<bool>(active_connection); }

    // Run to completion. Throws QueryError.
    duckdb::unique_ptr<duckdb::MaterializedQueryResult> Execute(const std::string& sql);

    // Start a streaming query; rows are produced as the result is fetched.
    // Throws QueryError if the statement fails before producing rows.
    duckdb::unique_ptr<duckdb::QueryResult> Stream(const std::string& sql);

    void MarkQueryStart() { query_start_time = Clock::now(); query_running.store(true, std::memory_order_release); }
    void MarkQueryEnd() { query_running = false; }
    bool IsQueryRunning() const { return query_running.load(std::memory_order_acquire); }
    TimePoint GetQueryStartTime() const { return query_start_time; }

    uint64_t GetQueryCount() const { return query_count; }

    void InterruptQuery();

private:
    uint64_t session_id;
    TimePoint created_at;

    ConnectionPool* pool;
    PooledConnection active_connection;

    std::string catalog;
    std::string schema;
    bool bind_database;

    std::atomic<bool> query_running{false};
    std::atomic<uint64_t> query_count{0};
    TimePoint query_start_time;
};

} // namespace duckes
