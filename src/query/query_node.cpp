//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// query/query_node.cpp
//===----------------------------------------------------------------------===//

#include "query/query_node.hpp"
#include "logging/logger.hpp"

namespace duckes {

QueryNode::QueryNode(uint32_t node_id_p, bool coordinator_p, const ConnectionPool::Config& pool_config)
    : node_id(node_id_p)
    , coordinator(coordinator_p) {
    duckdb::DBConfig db_config;
    db_config.SetOptionByName("autoload_known_extensions", duckdb::Value::BOOLEAN(true));
    db_config.SetOptionByName("autoinstall_known_extensions", duckdb::Value::BOOLEAN(true));

    db = std::make_shared<duckdb::DuckDB>(nullptr, &db_config);
    connection_pool = std::make_unique<ConnectionPool>(db->instance, pool_config);

    LOG_INFO("query_node", GetName() + " started");
}

QueryNode::~QueryNode() {
    Close();
}

std::string QueryNode::GetName() const {
    return (coordinator ? "coordinator-" : "worker-") + std::to_string(node_id);
}

SessionPtr QueryNode::CreateSession(const std::string& catalog, const std::string& schema, bool bind_database) {
    if (!connection_pool) {
        throw std::runtime_error(GetName() + " is closed");
    }
    return std::make_shared<Session>(next_session_id++, connection_pool.get(), catalog, schema, bind_database);
}

void QueryNode::ExecuteStatement(const std::string& sql) {
    if (!connection_pool) {
        throw std::runtime_error(GetName() + " is closed");
    }
    auto conn = connection_pool->Acquire();
    if (!conn) {
        throw std::runtime_error(GetName() + ": failed to acquire connection from pool");
    }
    auto result = conn->Query(sql);
    if (result->HasError()) {
        throw QueryError(GetName() + ": " + result->GetError());
    }
}

TypeDecoder& QueryNode::GetTypeDecoder() {
    std::lock_guard<std::mutex> lock(decoder_mutex);
    if (!type_decoder) {
        type_decoder = std::make_unique<TypeDecoder>(*db->instance);
    }
    return *type_decoder;
}

void QueryNode::Close() {
    if (!db) {
        return;
    }
    type_decoder.reset();
    if (connection_pool) {
        connection_pool->Shutdown();
        connection_pool.reset();
    }
    db.reset();
    LOG_INFO("query_node", GetName() + " stopped");
}

} // namespace duckes
