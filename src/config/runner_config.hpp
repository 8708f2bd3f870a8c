//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// config/runner_config.hpp
//
// Query runner configuration
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/duration.hpp"
#include "config/yaml_config.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <sstream>

#ifndef DUCKES_RESOURCE_DIR
#define DUCKES_RESOURCE_DIR "resources"
#endif

namespace duckes {

struct RunnerConfig {
    // Query cluster
    uint32_t node_count = DEFAULT_NODE_COUNT;
    uint16_t http_port = 0;  // coordinator endpoint, 0 = ephemeral

    // Loading
    std::vector<std::string> tables;  // empty = every benchmark table
    size_t batch_size = DEFAULT_BATCH_SIZE;

    // Embedded search node
    std::string search_host = "127.0.0.1";
    uint16_t search_port = 0;  // 0 = ephemeral

    // Table descriptions directory
    std::string table_description_dir = std::string(DUCKES_RESOURCE_DIR) + "/queryrunner";

    // Search catalog properties, passed verbatim to the connector
    std::map<std::string, std::string> search_properties = {
        {"default-schema-name", SEARCH_SCHEMA},
        {"scroll-size", "1000"},
        {"scroll-timeout", "1m"},
        {"request-timeout", "2m"},
        {"max-request-retries", "3"},
        {"max-request-retry-time", "5s"},
    };

    // Logging
    std::string log_file;
    std::string log_level = "info";

    std::string config_file;

    // Catalog properties with the table description directory as a file:// URI
    std::map<std::string, std::string> BuildSearchCatalogProperties() const {
        auto properties = search_properties;
        if (properties.find("table-description-directory") == properties.end()) {
            std::error_code ec;
            auto absolute = std::filesystem::absolute(table_description_dir, ec);
            properties["table-description-directory"] =
                "file://" + (ec ? table_description_dir : absolute.lexically_normal().string());
        }
        return properties;
    }

    bool Validate(std::string& error) const {
        if (node_count == 0) {
            error = "Node count must be greater than 0";
            return false;
        }
        if (batch_size == 0) {
            error = "Batch size must be greater than 0";
            return false;
        }
        for (const char* key : {"scroll-timeout", "request-timeout", "max-request-retry-time"}) {
            auto it = search_properties.find(key);
            if (it != search_properties.end() && !ParseDuration(it->second)) {
                error = "Invalid duration for " + std::string(key) + ": " + it->second;
                return false;
            }
        }
        return true;
    }

    bool LoadFromFile(const std::string& path, std::string& error) {
        YamlConfig cfg;
        if (!cfg.Load(path)) {
            error = cfg.GetError();
            return false;
        }
        ApplyYaml(cfg);
        return true;
    }

    void ApplyYaml(const YamlConfig& cfg) {
        // Cluster section
        if (cfg.Has("cluster.nodes")) node_count = static_cast<uint32_t>(cfg.GetInt("cluster.nodes"));
        if (cfg.Has("cluster.http_port")) http_port = static_cast<uint16_t>(cfg.GetInt("cluster.http_port"));

        // Load section
        if (cfg.Has("load.tables")) tables = cfg.GetStringList("load.tables");
        if (cfg.Has("load.batch_size")) batch_size = static_cast<size_t>(cfg.GetInt64("load.batch_size"));

        // Search section
        if (cfg.Has("search.host")) search_host = cfg.GetString("search.host");
        if (cfg.Has("search.port")) search_port = static_cast<uint16_t>(cfg.GetInt("search.port"));
        for (const auto& entry : cfg.GetStringMap("search.properties")) {
            search_properties[entry.first] = entry.second;
        }

        // Resources section
        if (cfg.Has("resources.table_descriptions")) {
            table_description_dir = cfg.GetString("resources.table_descriptions");
        }

        // Logging section
        if (cfg.Has("logging.file")) log_file = cfg.GetString("logging.file");
        if (cfg.Has("logging.level")) log_level = cfg.GetString("logging.level");
    }
};

inline std::vector<std::string> SplitTableList(const std::string& list) {
    std::vector<std::string> result;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

inline void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>           YAML config file path\n"
              << "  -n, --nodes <n>               Query node count (default: 2)\n"
              << "  -t, --tables <a,b,...>        Benchmark tables to load (default: all)\n"
              << "  --batch-size <n>              Documents per bulk request (default: 1000)\n"
              << "  --search-port <port>          Embedded search port (default: ephemeral)\n"
              << "  --http-port <port>            Coordinator HTTP port (default: ephemeral)\n"
              << "  --table-descriptions <dir>    Table description directory\n"
              << "  --log-file <path>             Log file path\n"
              << "  --log-level <level>           Log level (debug, info, warn, error)\n"
              << "  --version                     Show version info\n"
              << "  --help                        Show this help\n";
}

inline RunnerConfig ParseCommandLine(int argc, char* argv[], bool& show_version) {
    RunnerConfig config;
    show_version = false;
    std::string config_file_path;

    // First pass: look for config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file_path = argv[++i];
        }
    }

    if (!config_file_path.empty()) {
        std::string error;
        if (!config.LoadFromFile(config_file_path, error)) {
            std::cerr << "Error loading config file: " << error << std::endl;
            std::exit(1);
        }
        config.config_file = config_file_path;
    }

    // Second pass: command line overrides config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            PrintUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--version") {
            show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            ++i;  // Already processed
        } else if ((arg == "-n" || arg == "--nodes") && i + 1 < argc) {
            config.node_count = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if ((arg == "-t" || arg == "--tables") && i + 1 < argc) {
            config.tables = SplitTableList(argv[++i]);
        } else if (arg == "--batch-size" && i + 1 < argc) {
            config.batch_size = static_cast<size_t>(std::stoull(argv[++i]));
        } else if (arg == "--search-port" && i + 1 < argc) {
            config.search_port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "--http-port" && i + 1 < argc) {
            config.http_port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "--table-descriptions" && i + 1 < argc) {
            config.table_description_dir = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.log_level = argv[++i];
        }
    }

    return config;
}

} // namespace duckes
