//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// runner/query_runner.cpp
//===----------------------------------------------------------------------===//

#include "runner/query_runner.hpp"
#include "config/duration.hpp"
#include "connector/tpch/tpch_plugin.hpp"
#include "errors/harness_error.hpp"
#include "logging/logger.hpp"
#include "search/embedded_search_node.hpp"
#include "duckdb/parser/keyword_helper.hpp"

namespace duckes {

//===----------------------------------------------------------------------===//
// RunningCluster
//===----------------------------------------------------------------------===//

RunningCluster::RunningCluster(const RunnerConfig& config_p)
    : config(config_p) {
}

RunningCluster::~RunningCluster() {
    Close();
}

void RunningCluster::Close() {
    guard.ReleaseAll();
}

std::string RunningCluster::GetBaseUrl() const {
    return query_cluster ? query_cluster->GetBaseUrl() : std::string();
}

SearchConnector& RunningCluster::GetSearchConnector() {
    return GetCatalogs().GetConnectorAs<SearchConnector>(SEARCH_CATALOG);
}

SessionPtr RunningCluster::CreateSession(const std::string& catalog, const std::string& schema) {
    return query_cluster->CreateSession(catalog, schema);
}

TableLoadResult RunningCluster::LoadTable(const std::string& table) {
    TableLoadResult result;
    result.table = table;
    result.index = TableDescriptor::IndexNameFor(table);

    auto& connector = GetSearchConnector();
    const auto& connector_config = connector.GetConfig();

    if (const auto* descriptor = connector.GetTable(connector_config.default_schema, result.index)) {
        connector.CreateIndex(*descriptor);
    }

    if (!source_session) {
        source_session = query_cluster->CreateSession(TPCH_CATALOG, TPCH_TINY_SCHEMA);
    }

    SearchLoader::Options options;
    options.batch_size = config.batch_size;
    options.retry = connector_config.GetRetryPolicy();
    SearchLoader loader(source_session.get(), connector.GetClient(), options);

    std::string sql = "SELECT * FROM " + std::string(TPCH_CATALOG) + "." + TPCH_TINY_SCHEMA + "." +
                      duckdb::KeywordHelper::WriteOptionallyQuoted(result.index);

    LOG_INFO("runner", "Running import for " + result.index);
    auto start = Clock::now();
    result.rows = loader.Load(sql, result.index, table);
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    result.stats = loader.GetStats();
    LOG_INFO("runner", "Imported " + std::to_string(result.rows) + " rows of " + result.index +
             " in " + FormatDuration(result.elapsed));

    load_results.push_back(result);
    return result;
}

//===----------------------------------------------------------------------===//
// QueryRunner
//===----------------------------------------------------------------------===//

std::unique_ptr<RunningCluster> QueryRunner::BuildCluster(uint32_t node_count,
                                                          const std::vector<std::string>& tables) {
    RunnerConfig config;
    config.node_count = node_count;
    config.tables = tables;
    return BuildCluster(config);
}

std::unique_ptr<RunningCluster> QueryRunner::BuildCluster(const RunnerConfig& config) {
    Options options;
    options.config = config;
    return BuildCluster(options);
}

std::unique_ptr<RunningCluster> QueryRunner::BuildCluster(const Options& options) {
    std::string error;
    if (!options.config.Validate(error)) {
        throw ConfigError(error);
    }
    for (const auto& table : options.config.tables) {
        if (!IsTpchTable(TableDescriptor::IndexNameFor(table))) {
            throw ConfigError("Unknown benchmark table: " + table);
        }
    }

    std::unique_ptr<RunningCluster> running(new RunningCluster(options.config));
    try {
        Bootstrap(*running, options);
        LoadTables(*running);
    } catch (const HarnessError& e) {
        LOG_ERROR("runner", std::string("Query runner startup failed: ") + e.what());
        running->Close();
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("runner", std::string("Query runner startup failed: ") + e.what());
        running->Close();
        throw BootstrapError(std::string("Failed to start query runner: ") + e.what());
    }
    return running;
}

void QueryRunner::Bootstrap(RunningCluster& running, const Options& options) {
    const RunnerConfig& config = options.config;

    // Search engine first: nothing else is started if it cannot come up
    if (options.search_engine_factory) {
        running.search_engine = options.search_engine_factory(config);
    } else {
        EmbeddedSearchNode::Config node_config;
        node_config.host = config.search_host;
        node_config.port = config.search_port;
        running.search_engine = std::make_unique<EmbeddedSearchNode>(node_config);
    }
    if (!running.search_engine) {
        throw BootstrapError("Search engine factory returned no engine");
    }
    SearchEngine* engine = running.search_engine.get();
    running.guard.Push("search engine", [engine]() { engine->Stop(); });
    engine->Start();
    LOG_INFO("runner", "Search engine listening on " + engine->GetHost() + ":" + std::to_string(engine->GetPort()));

    QueryCluster::Config cluster_config;
    cluster_config.node_count = config.node_count;
    cluster_config.http_port = config.http_port;
    if (options.query_cluster_factory) {
        running.query_cluster = options.query_cluster_factory(cluster_config);
    } else {
        running.query_cluster = std::make_unique<QueryCluster>(cluster_config);
    }
    if (!running.query_cluster) {
        throw BootstrapError("Query cluster factory returned no cluster");
    }
    QueryCluster* cluster = running.query_cluster.get();
    running.guard.Push("query cluster", [cluster]() { cluster->Close(); });
    cluster->Start();

    cluster->InstallPlugin(std::make_shared<TpchPlugin>());
    cluster->CreateCatalog(TPCH_CATALOG, TPCH_CONNECTOR);

    CatalogProperties search_properties = config.BuildSearchCatalogProperties();
    auto connector_config = SearchConnectorConfig::FromProperties(search_properties);
    auto provider = ResolveTableDescriptions(connector_config, cluster->GetCoordinator().GetTypeDecoder());

    cluster->InstallPlugin(std::make_shared<SearchPlugin>(provider, engine->GetHost(), engine->GetPort()));
    cluster->CreateCatalog(SEARCH_CATALOG, SEARCH_CONNECTOR, search_properties);

    running.default_session = cluster->CreateSession(SEARCH_CATALOG, SEARCH_SCHEMA);
    running.guard.Push("sessions", [&running]() {
        running.source_session.reset();
        running.default_session.reset();
    });
}

void QueryRunner::LoadTables(RunningCluster& running) {
    std::vector<std::string> tables = running.config.tables;
    if (tables.empty()) {
        tables = TpchTables();
    }

    LOG_INFO("runner", "Loading data...");
    auto start = Clock::now();
    for (const auto& table : tables) {
        running.LoadTable(table);
    }
    LOG_INFO("runner", "Loading complete in " + FormatDuration(Clock::now() - start));
}

} // namespace duckes
