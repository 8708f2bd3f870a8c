//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// session/session.cpp
//
// Session implementation
//===----------------------------------------------------------------------===//

#include "session/session.hpp"
#include "logging/logger.hpp"
#include "duckdb/parser/keyword_helper.hpp"

namespace duckes {

Session::Session(uint64_t session_id_p, ConnectionPool* pool_p,
                 std::string catalog_p, std::string schema_p, bool bind_database_p)
    : session_id(session_id_p)
    , created_at(Clock::now())
    , pool(pool_p)
    , catalog(std::move(catalog_p))
    , schema(std::move(schema_p))
    , bind_database(bind_database_p) {
}

Session::~Session() {
    LOG_DEBUG("session", "Session " + std::to_string(session_id) + " closed after " +
              std::to_string(query_count.load()) + " queries");
}

duckdb::Connection& Session::GetConnection() {
    if (active_connection) {
        return *active_connection;
    }
    if (!pool) {
        throw std::runtime_error("Session has no connection pool");
    }

    auto acquired = pool->Acquire();
    if (!acquired) {
        throw std::runtime_error("Failed to acquire connection from pool");
    }

    if (bind_database) {
        std::string target = duckdb::KeywordHelper::WriteOptionallyQuoted(catalog);
        if (!schema.empty()) {
            target += "." + duckdb::KeywordHelper::WriteOptionallyQuoted(schema);
        }
        auto result = acquired->Query("USE " + target);
        if (result->HasError()) {
            throw QueryError("Cannot bind session to " + target + ": " + result->GetError());
        }
    }

    active_connection = std::move(acquired);
    return *active_connection;
}

void Session::ReleaseConnection() {
    if (active_connection) {
        LOG_DEBUG("session", "Session " + std::to_string(session_id) + " releasing connection back to pool");
        active_connection.Release();
    }
}

duckdb::unique_ptr<duckdb::MaterializedQueryResult> Session::Execute(const std::string& sql) {
    auto& conn = GetConnection();
    query_count++;
    MarkQueryStart();
    auto result = conn.Query(sql);
    MarkQueryEnd();
    if (result->HasError()) {
        throw QueryError(result->GetError());
    }
    return result;
}

duckdb::unique_ptr<duckdb::QueryResult> Session::Stream(const std::string& sql) {
    auto& conn = GetConnection();
    query_count++;
    MarkQueryStart();
    auto result = conn.SendQuery(sql);
    if (result->HasError()) {
        MarkQueryEnd();
        throw QueryError(result->GetError());
    }
    return result;
}

void Session::InterruptQuery() {
    if (active_connection) {
        active_connection->Interrupt();
    }
}

} // namespace duckes
