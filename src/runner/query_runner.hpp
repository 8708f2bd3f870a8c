//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// runner/query_runner.hpp
//
// Bootstraps the search engine and query cluster, registers the tpch and
// search catalogs, and seeds the search engine with the benchmark tables
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/runner_config.hpp"
#include "connector/search/search_connector.hpp"
#include "loader/search_loader.hpp"
#include "query/query_cluster.hpp"
#include "runner/resource_guard.hpp"
#include "search/search_engine.hpp"

namespace duckes {

struct TableLoadResult {
    std::string table;
    std::string index;
    uint64_t rows = 0;
    std::chrono::milliseconds elapsed{0};
    SearchLoader::Stats stats;
};

class RunningCluster {
public:
    ~RunningCluster();

    RunningCluster(const RunningCluster&) = delete;
    RunningCluster& operator=(const RunningCluster&) = delete;

    // Session, query cluster, then search engine. Idempotent.
    void Close();

    std::string GetBaseUrl() const;
    QueryCluster& GetQueryCluster() { return *query_cluster; }
    CatalogRegistry& GetCatalogs() { return query_cluster->GetCatalogs(); }
    SearchEngine& GetSearchEngine() { return *search_engine; }
    SearchConnector& GetSearchConnector();

    // Bound to catalog "search", schema "tpch"
    Session& GetSession() { return *default_session; }
    SessionPtr CreateSession(const std::string& catalog, const std::string& schema);

    // Indexes tpch.tiny.<table> into its lower-cased index. Loading a table
    // twice indexes its rows twice. Throws LoadError.
    TableLoadResult LoadTable(const std::string& table);

    const std::vector<TableLoadResult>& GetLoadResults() const { return load_results; }

private:
    friend class QueryRunner;
    explicit RunningCluster(const RunnerConfig& config_p);

    RunnerConfig config;
    std::unique_ptr<SearchEngine> search_engine;
    std::unique_ptr<QueryCluster> query_cluster;
    SessionPtr default_session;
    SessionPtr source_session;
    std::vector<TableLoadResult> load_results;
    ResourceGuard guard;
};

class QueryRunner {
public:
    using SearchEngineFactory = std::function<std::unique_ptr<SearchEngine>(const RunnerConfig&)>;
    using QueryClusterFactory = std::function<std::unique_ptr<QueryCluster>(const QueryCluster::Config&)>;

    struct Options {
        RunnerConfig config;
        // Defaults: EmbeddedSearchNode and QueryCluster
        SearchEngineFactory search_engine_factory;
        QueryClusterFactory query_cluster_factory;
    };

    // Throws BootstrapError, ConfigError or LoadError after releasing
    // everything acquired so far
    static std::unique_ptr<RunningCluster> BuildCluster(uint32_t node_count, const std::vector<std::string>& tables);
    static std::unique_ptr<RunningCluster> BuildCluster(const RunnerConfig& config);
    static std::unique_ptr<RunningCluster> BuildCluster(const Options& options);

private:
    static void Bootstrap(RunningCluster& running, const Options& options);
    static void LoadTables(RunningCluster& running);
};

} // namespace duckes
