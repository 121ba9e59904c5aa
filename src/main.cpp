#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "harbor/core/config.h"
#include "harbor/core/logger.h"
#include "harbor/http/http_server.h"
#include "harbor/http/route_registration.h"
#include "harbor/http/router.h"
#include "harbor/jobs/cleanup_queue.h"
#include "harbor/jobs/staging_file_remover.h"
#include "harbor/metadata/sqlite_metadata_store.h"
#include "harbor/services/file_service.h"
#include "harbor/services/search_indexer.h"
#include "harbor/services/staging_file_service.h"
#include "harbor/storage/local_file_system.h"

namespace {

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

int Run(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/server.json");
    const std::string db_path = GetArgValue(argc, argv, "--database", "config/database.json");

    auto config = harbor::core::LoadConfig(config_path);
    harbor::core::InitLogging(config.observability.log_level);

    auto sqlite_path = harbor::core::LoadDatabasePath(db_path);
    const auto sqlite_dir = std::filesystem::path(sqlite_path).parent_path();
    if (!sqlite_dir.empty()) {
        std::filesystem::create_directories(sqlite_dir);
    }
    auto metadata = std::make_shared<harbor::metadata::SqliteMetadataStore>(sqlite_path);
    auto driver = std::make_shared<harbor::storage::LocalFileSystem>(config.storage.resident_path,
                                                                     config.storage.staging_path);

    auto cleanup_queue = std::make_shared<harbor::jobs::CleanupQueue>(
        static_cast<std::size_t>(config.cleanup.delete_queue_capacity),
        config.cleanup.delete_workers,
        [driver](const std::string& id) { return driver->RemoveStaging(id); });
    auto staging = std::make_shared<harbor::services::StagingFileService>(
        metadata, driver, cleanup_queue, config.storage);
    auto files = std::make_shared<harbor::services::FileService>(
        metadata, driver, std::make_shared<harbor::services::LoggingSearchIndexer>(),
        config.storage);

    harbor::http::Router router;
    harbor::http::RegisterDefaultRoutes(router, staging, files);

    boost::asio::io_context ioc(config.server.threads);
    harbor::http::HttpServer server(ioc, config, std::move(router), staging, files);
    server.Run();

    harbor::jobs::StagingFileRemover remover(ioc, staging, config.cleanup);
    if (config.cleanup.enabled) {
        remover.Start();
    }

    std::thread shutdown_thread;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        harbor::core::LogInfo("Received signal " + std::to_string(signal_number) +
                              ", shutting down");
        // Stop blocks on an in-flight sweep, which itself runs on an io thread.
        shutdown_thread = std::thread([&remover, &ioc]() {
            remover.Stop();
            ioc.stop();
        });
    });

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.server.threads));
    for (int i = 0; i < config.server.threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }
    if (shutdown_thread.joinable()) {
        shutdown_thread.join();
    }

    remover.Stop();
    cleanup_queue->Shutdown();
    harbor::core::LogInfo("Shutdown complete");
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        return Run(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << "harbor_server: " << ex.what() << std::endl;
        return 1;
    }
}
