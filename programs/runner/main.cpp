//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// main.cpp
//
// Starts the query runner and keeps it up until SIGINT/SIGTERM
//===----------------------------------------------------------------------===//

#include "common.hpp"
#include "config/runner_config.hpp"
#include "errors/harness_error.hpp"
#include "logging/logger.hpp"
#include "runner/query_runner.hpp"
#include "version.hpp"

#include <csignal>
#include <iostream>
#include <pthread.h>

using namespace duckes;

void PrintVersion() {
    std::cout << "DuckES Query Runner " << DUCKES_VERSION << "\n"
              << "Build type: " << DUCKES_BUILD_TYPE << "\n";
}

int main(int argc, char* argv[]) {
    try {
        bool show_version;
        RunnerConfig config = ParseCommandLine(argc, argv, show_version);

        if (show_version) {
            PrintVersion();
            return 0;
        }

        std::string error;
        if (!config.Validate(error)) {
            std::cerr << "Configuration error: " << error << std::endl;
            return 1;
        }

        Logger::Initialize(config.log_file, config.log_level);

        // Block SIGINT/SIGTERM before any thread starts so only sigwait()
        // in the main thread sees them
        sigset_t shutdown_mask;
        sigemptyset(&shutdown_mask);
        sigaddset(&shutdown_mask, SIGINT);
        sigaddset(&shutdown_mask, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &shutdown_mask, nullptr);

        std::signal(SIGPIPE, SIG_IGN);

        LOG_INFO("main", "Starting DuckES Query Runner " + std::string(DUCKES_VERSION));
        LOG_INFO("main", "  Nodes: " + std::to_string(config.node_count));
        LOG_INFO("main", "  Batch size: " + std::to_string(config.batch_size));
        LOG_INFO("main", "  Table descriptions: " + config.table_description_dir);
        if (!Logger::GetLogFile().empty()) {
            LOG_INFO("main", "  Log file: " + Logger::GetLogFile());
        }

        std::unique_ptr<RunningCluster> cluster;
        try {
            cluster = QueryRunner::BuildCluster(config);
        } catch (const HarnessError& e) {
            LOG_ERROR("main", std::string("Failed to start: ") + e.what());
            Logger::Shutdown();
            std::cerr << "Fatal error: " << e.what() << std::endl;
            return 1;
        }

        std::cout << "======== SERVER STARTED ========" << std::endl;
        std::cout << "\n====\n" << cluster->GetBaseUrl() << "\n====" << std::endl;

        int sig;
        if (sigwait(&shutdown_mask, &sig) == 0) {
            LOG_INFO("main", "Shutdown signal received");
        }

        LOG_INFO("main", "Shutting down...");
        cluster->Close();
        cluster.reset();
        LOG_INFO("main", "DuckES Query Runner stopped");

        Logger::Shutdown();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
