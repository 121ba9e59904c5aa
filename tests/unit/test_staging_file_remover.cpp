#include <chrono>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "harbor/core/ids.h"
#include "harbor/core/time.h"
#include "harbor/jobs/cleanup_queue.h"
#include "harbor/jobs/staging_file_remover.h"
#include "harbor/metadata/sqlite_metadata_store.h"
#include "harbor/services/staging_file_service.h"
#include "harbor/storage/local_file_system.h"

namespace {

struct SweepHarness {
    SweepHarness() {
        root = std::filesystem::temp_directory_path() /
               ("harbor_sweep_" + Poco::UUIDGenerator().createOne().toString());
        std::filesystem::create_directories(root);
        store = std::make_shared<harbor::metadata::SqliteMetadataStore>(
            (root / "metadata.db").string());
        driver = std::make_shared<harbor::storage::LocalFileSystem>(
            (root / "files").string(), (root / "staging").string());
        queue = std::make_shared<harbor::jobs::CleanupQueue>(
            4, 1, [d = driver](const std::string& id) { return d->RemoveStaging(id); });
        staging = std::make_shared<harbor::services::StagingFileService>(
            store, driver, queue, harbor::core::StorageConfig{});
    }

    ~SweepHarness() {
        queue->Shutdown();
        staging.reset();
        store.reset();
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    std::string StageAged(const std::string& name, long long age_seconds) {
        harbor::metadata::StagingFile file;
        file.id = harbor::core::GenerateObjectId();
        file.name = name;
        file.staged_at = harbor::core::NowIso8601WithOffsetSeconds(-age_seconds);
        EXPECT_TRUE(store->CreateStagingFile(file).ok());
        std::istringstream in(name);
        EXPECT_TRUE(staging->Fill(file.id, 0, in).ok());
        return file.id;
    }

    std::filesystem::path root;
    std::shared_ptr<harbor::metadata::SqliteMetadataStore> store;
    std::shared_ptr<harbor::storage::LocalFileSystem> driver;
    std::shared_ptr<harbor::jobs::CleanupQueue> queue;
    std::shared_ptr<harbor::services::StagingFileService> staging;
};

}  // namespace

TEST(StagingFileRemover, SweepRespectsAgeAndBatchLimit) {
    SweepHarness h;
    const auto three_hours = h.StageAged("3h", 3 * 3600);
    const auto two_hours = h.StageAged("2h", 2 * 3600);
    const auto one_hour = h.StageAged("1h", 3600);

    boost::asio::io_context ioc;
    harbor::core::CleanupConfig config;
    config.expiration_seconds = 90 * 60;
    config.batch_limit = 1;
    harbor::jobs::StagingFileRemover remover(ioc, h.staging, config);

    auto removed = remover.SweepOnce();
    ASSERT_TRUE(removed.ok());
    EXPECT_EQ(removed.value(), 1u);
    EXPECT_FALSE(h.staging->Get(three_hours).ok());
    EXPECT_TRUE(h.staging->Get(two_hours).ok());
    EXPECT_TRUE(h.staging->Get(one_hour).ok());

    h.queue->Shutdown();
    EXPECT_FALSE(std::filesystem::exists(h.driver->StagingObjectPath(three_hours)));
    EXPECT_TRUE(std::filesystem::exists(h.driver->StagingObjectPath(two_hours)));
}

TEST(StagingFileRemover, EmptySweepRemovesNothing) {
    SweepHarness h;
    const auto fresh = h.StageAged("fresh", 10);

    boost::asio::io_context ioc;
    harbor::core::CleanupConfig config;
    config.expiration_seconds = 3600;
    harbor::jobs::StagingFileRemover remover(ioc, h.staging, config);

    auto removed = remover.SweepOnce();
    ASSERT_TRUE(removed.ok());
    EXPECT_EQ(removed.value(), 0u);
    EXPECT_TRUE(h.staging->Get(fresh).ok());
}

TEST(StagingFileRemover, TicksUntilStopped) {
    SweepHarness h;
    const auto old_upload = h.StageAged("old", 7200);

    boost::asio::io_context ioc;
    auto work = boost::asio::make_work_guard(ioc);
    std::thread io_thread([&ioc]() { ioc.run(); });

    harbor::core::CleanupConfig config;
    config.period_seconds = 1;
    config.expiration_seconds = 3600;
    harbor::jobs::StagingFileRemover remover(ioc, h.staging, config);
    remover.Start();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (h.staging->Get(old_upload).ok() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    EXPECT_FALSE(h.staging->Get(old_upload).ok());

    remover.Stop();
    // Uploads that expire after Stop stay until the next start.
    const auto later = h.StageAged("later", 7200);
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    EXPECT_TRUE(h.staging->Get(later).ok());

    work.reset();
    ioc.stop();
    io_thread.join();
}
