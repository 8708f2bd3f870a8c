//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// session/connection_pool.hpp
//
// DuckDB connection pool of one query node
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "duckdb.hpp"
#include <parallel_hashmap/phmap.h>

namespace duckes {

class ConnectionPool;

//===----------------------------------------------------------------------===//
// Pooled Connection - RAII wrapper that returns connection to pool
//===----------------------------------------------------------------------===//

class PooledConnection {
public:
    PooledConnection() : pool(nullptr), connection(nullptr) {}
    PooledConnection(ConnectionPool* pool_p, duckdb::Connection* conn);
    ~PooledConnection();

    // Move only
    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    duckdb::Connection* Get() const { return connection; }
    duckdb::Connection* operator->() const { return connection; }
    duckdb::Connection& operator*() const { return *connection; }

    explicit operator bool() const { return connection != nullptr; }

    // Release back to pool manually (called automatically by destructor)
    void Release();

private:
    ConnectionPool* pool;
    duckdb::Connection* connection;
};

//===----------------------------------------------------------------------===//
// Connection Pool
//===----------------------------------------------------------------------===//

class ConnectionPool {
public:
    struct Config {
        size_t min_connections;
        size_t max_connections;
        std::chrono::milliseconds acquire_timeout;

        Config()
            : min_connections(1)
            , max_connections(DEFAULT_MAX_SESSIONS)
            , acquire_timeout(5000) {}
    };

    struct Stats {
        size_t total_created = 0;
        size_t available = 0;
        size_t in_use = 0;
        size_t acquire_count = 0;
        size_t acquire_timeout_count = 0;
    };

    explicit ConnectionPool(duckdb::shared_ptr<duckdb::DatabaseInstance> db_instance_p,
                           const Config& config_p = Config{});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Returns an empty PooledConnection on timeout or after Shutdown()
    PooledConnection Acquire();
    PooledConnection Acquire(std::chrono::milliseconds timeout);

    Stats GetStats() const;
    const Config& GetConfig() const { return config; }

    // Release all idle connections and fail pending acquires
    void Shutdown();

private:
    friend class PooledConnection;

    void Release(duckdb::Connection* conn);

    duckdb::shared_ptr<duckdb::DatabaseInstance> db_instance;
    Config config;

    std::vector<std::unique_ptr<duckdb::Connection>> available;
    phmap::flat_hash_map<duckdb::Connection*, std::unique_ptr<duckdb::Connection>> in_use;
    mutable std::mutex mutex;
    std::condition_variable available_cv;
    bool running = true;

    std::atomic<size_t> total_created{0};
    std::atomic<size_t> acquire_count{0};
    std::atomic<size_t> acquire_timeout_count{0};
};

} // namespace duckes
