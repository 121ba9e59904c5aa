#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "harbor/core/config.h"

namespace {

std::filesystem::path MakeTempConfigPath() {
    const auto name = "harbor_cfg_" + Poco::UUIDGenerator().createOne().toString() + ".json";
    return std::filesystem::temp_directory_path() / name;
}

void WriteConfig(const std::filesystem::path& path, const std::string& tls,
                 const std::string& cleanup) {
    std::ofstream out(path);
    out << "{\n"
        << "  \"server\": {\n"
        << "    \"host\": \"127.0.0.1\",\n"
        << "    \"port\": 9090,\n"
        << "    \"threads\": 2,\n"
        << "    \"tls\": " << tls << ",\n"
        << "    \"limits\": {\"max_body_bytes\": 1048576}\n"
        << "  },\n"
        << "  \"storage\": {\"resident_path\": \"data/r\", \"staging_path\": \"data/s\","
        << " \"lock_wait_ms\": 500},\n"
        << "  \"cleanup\": " << cleanup << ",\n"
        << "  \"observability\": {\"log_level\": \"warning\"}\n"
        << "}\n";
}

const std::string kNoTls = "{\"enabled\": false, \"certificate\": \"\", \"private_key\": \"\"}";

}  // namespace

TEST(Config, LoadsValuesAndDefaults) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, kNoTls, "{\"period_seconds\": 60, \"expiration_seconds\": 120}");

    auto config = harbor::core::LoadConfig(path.string());
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.threads, 2);
    EXPECT_EQ(config.server.limits.max_body_bytes, 1048576u);
    EXPECT_EQ(config.storage.resident_path, "data/r");
    EXPECT_EQ(config.storage.staging_path, "data/s");
    EXPECT_EQ(config.storage.lock_wait_ms, 500);
    EXPECT_EQ(config.storage.lock_lease_seconds, 600);
    EXPECT_TRUE(config.cleanup.enabled);
    EXPECT_EQ(config.cleanup.period_seconds, 60);
    EXPECT_EQ(config.cleanup.expiration_seconds, 120);
    EXPECT_EQ(config.cleanup.batch_limit, 100);
    EXPECT_EQ(config.cleanup.delete_workers, 2);
    EXPECT_EQ(config.cleanup.delete_queue_capacity, 256);
    EXPECT_EQ(config.observability.log_level, "warning");

    std::filesystem::remove(path);
}

TEST(Config, TlsEnabledRequiresCertificate) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"enabled\": true, \"certificate\": \"\", \"private_key\": \"key.pem\"}",
                "{}");

    EXPECT_THROW({ (void)harbor::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, RejectsNonPositiveCleanupPeriod) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, kNoTls, "{\"period_seconds\": 0}");

    EXPECT_THROW({ (void)harbor::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, RejectsZeroDeleteWorkers) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, kNoTls, "{\"delete_workers\": 0}");

    EXPECT_THROW({ (void)harbor::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, LoadsDatabasePath) {
    const auto path = MakeTempConfigPath();
    {
        std::ofstream out(path);
        out << "{\"sqlite\": {\"path\": \"/tmp/harbor.db\"}}";
    }

    EXPECT_EQ(harbor::core::LoadDatabasePath(path.string()), "/tmp/harbor.db");

    std::filesystem::remove(path);
}
