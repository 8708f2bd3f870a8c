//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// session/connection_pool.cpp
//
// DuckDB connection pool implementation
//===----------------------------------------------------------------------===//

#include "session/connection_pool.hpp"
#include "logging/logger.hpp"

namespace duckes {

//===----------------------------------------------------------------------===//
// PooledConnection
//===----------------------------------------------------------------------===//

PooledConnection::PooledConnection(ConnectionPool* pool_p, duckdb::Connection* conn)
    : pool(pool_p), connection(conn) {}

PooledConnection::~PooledConnection() {
    Release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool(other.pool), connection(other.connection) {
    other.pool = nullptr;
    other.connection = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        Release();
        pool = other.pool;
        connection = other.connection;
        other.pool = nullptr;
        other.connection = nullptr;
    }
    return *this;
}

void PooledConnection::Release() {
    if (pool && connection) {
        pool->Release(connection);
        pool = nullptr;
        connection = nullptr;
    }
}

//===----------------------------------------------------------------------===//
// ConnectionPool
//===----------------------------------------------------------------------===//

ConnectionPool::ConnectionPool(duckdb::shared_ptr<duckdb::DatabaseInstance> db_instance_p,
                               const Config& config_p)
    : db_instance(std::move(db_instance_p))
    , config(config_p) {

    for (size_t i = 0; i < config.min_connections; ++i) {
        available.push_back(std::make_unique<duckdb::Connection>(*db_instance));
        total_created++;
    }

    LOG_DEBUG("conn_pool", "Connection pool created with " +
              std::to_string(available.size()) + " connections " +
              "(min=" + std::to_string(config.min_connections) +
              ", max=" + std::to_string(config.max_connections) + ")");
}

ConnectionPool::~ConnectionPool() {
    Shutdown();
}

void ConnectionPool::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex);
    if (!running) {
        return;
    }
    running = false;
    available_cv.notify_all();

    size_t released = available.size();
    available.clear();

    // Connections still checked out are destroyed by their PooledConnection
    LOG_DEBUG("conn_pool", "Connection pool shutdown, " + std::to_string(released) +
              " idle connections released, " + std::to_string(in_use.size()) + " in use");
}

PooledConnection ConnectionPool::Acquire() {
    return Acquire(config.acquire_timeout);
}

PooledConnection ConnectionPool::Acquire(std::chrono::milliseconds timeout) {
    acquire_count++;
    auto deadline = Clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex);

    while (running) {
        if (!available.empty()) {
            auto conn = std::move(available.back());
            available.pop_back();

            duckdb::Connection* raw_ptr = conn.get();
            in_use[raw_ptr] = std::move(conn);
            return PooledConnection(this, raw_ptr);
        }

        if (in_use.size() < config.max_connections) {
            auto conn = std::make_unique<duckdb::Connection>(*db_instance);
            total_created++;

            duckdb::Connection* raw_ptr = conn.get();
            in_use[raw_ptr] = std::move(conn);

            LOG_DEBUG("conn_pool", "Created new connection (total=" +
                      std::to_string(in_use.size() + available.size()) + ")");
            return PooledConnection(this, raw_ptr);
        }

        auto now = Clock::now();
        if (now >= deadline) {
            acquire_timeout_count++;
            LOG_WARN("conn_pool", "Connection acquire timeout after " +
                     std::to_string(timeout.count()) + "ms");
            return PooledConnection();
        }
        available_cv.wait_until(lock, deadline);
    }

    return PooledConnection();
}

void ConnectionPool::Release(duckdb::Connection* conn) {
    if (!conn) return;

    std::lock_guard<std::mutex> lock(mutex);

    auto it = in_use.find(conn);
    if (it == in_use.end()) {
        LOG_WARN("conn_pool", "Releasing unknown connection");
        return;
    }

    auto entry = std::move(it->second);
    in_use.erase(it);

    if (!running) {
        return;
    }

    // LIFO: push_back, Acquire pops from back
    available.push_back(std::move(entry));
    available_cv.notify_one();
}

ConnectionPool::Stats ConnectionPool::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex);
    Stats stats;
    stats.total_created = total_created;
    stats.available = available.size();
    stats.in_use = in_use.size();
    stats.acquire_count = acquire_count;
    stats.acquire_timeout_count = acquire_timeout_count;
    return stats;
}

} // namespace duckes
