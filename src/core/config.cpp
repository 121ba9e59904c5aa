#include "harbor/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

namespace harbor::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

void RequirePositive(int value, const char* key) {
    if (value <= 0) {
        throw std::invalid_argument(std::string(key) + " must be positive");
    }
}

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.server.host = cfg->getString("server.host", "0.0.0.0");
    config.server.port = cfg->getInt("server.port", 8080);
    config.server.threads = cfg->getInt("server.threads", 4);
    config.server.tls.enabled = cfg->getBool("server.tls.enabled", false);
    config.server.tls.certificate = cfg->getString("server.tls.certificate", "");
    config.server.tls.private_key = cfg->getString("server.tls.private_key", "");
    config.server.limits.max_body_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("server.limits.max_body_bytes", 268435456));

    config.storage.resident_path = cfg->getString("storage.resident_path", "data/files");
    config.storage.staging_path = cfg->getString("storage.staging_path", "data/staging");
    config.storage.lock_wait_ms = cfg->getInt("storage.lock_wait_ms", 30000);
    config.storage.lock_lease_seconds = cfg->getInt("storage.lock_lease_seconds", 600);

    config.cleanup.enabled = cfg->getBool("cleanup.enabled", true);
    config.cleanup.period_seconds = cfg->getInt("cleanup.period_seconds", 3600);
    config.cleanup.expiration_seconds = cfg->getInt("cleanup.expiration_seconds", 86400);
    config.cleanup.batch_limit = cfg->getInt("cleanup.batch_limit", 100);
    config.cleanup.delete_workers = cfg->getInt("cleanup.delete_workers", 2);
    config.cleanup.delete_queue_capacity = cfg->getInt("cleanup.delete_queue_capacity", 256);

    config.observability.log_level = cfg->getString("observability.log_level", "information");

    if (config.server.tls.enabled) {
        // Fail fast instead of accepting connections that can never complete a handshake.
        if (IsBlank(config.server.tls.certificate)) {
            throw std::invalid_argument("server.tls.enabled=true requires server.tls.certificate");
        }
        if (IsBlank(config.server.tls.private_key)) {
            throw std::invalid_argument("server.tls.enabled=true requires server.tls.private_key");
        }
    }
    if (IsBlank(config.storage.resident_path) || IsBlank(config.storage.staging_path)) {
        throw std::invalid_argument("storage.resident_path and storage.staging_path are required");
    }
    RequirePositive(config.server.threads, "server.threads");
    RequirePositive(config.storage.lock_wait_ms, "storage.lock_wait_ms");
    RequirePositive(config.storage.lock_lease_seconds, "storage.lock_lease_seconds");
    RequirePositive(config.cleanup.period_seconds, "cleanup.period_seconds");
    RequirePositive(config.cleanup.expiration_seconds, "cleanup.expiration_seconds");
    RequirePositive(config.cleanup.batch_limit, "cleanup.batch_limit");
    RequirePositive(config.cleanup.delete_workers, "cleanup.delete_workers");
    RequirePositive(config.cleanup.delete_queue_capacity, "cleanup.delete_queue_capacity");
    return config;
}

std::string LoadDatabasePath(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));
    return cfg->getString("sqlite.path", "data/metadata.db");
}

}  // namespace harbor::core
