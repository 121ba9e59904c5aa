#pragma once

#include <cstdint>
#include <string>

namespace harbor::core {

/// @brief TLS configuration for the HTTP server.
struct TlsConfig {
    bool enabled{false};
    std::string certificate;
    std::string private_key;
};

/// @brief Request/connection limits for the HTTP server.
struct LimitsConfig {
    /// Largest accepted request body, i.e. the largest single upload chunk.
    std::uint64_t max_body_bytes{268435456};
};

/// @brief HTTP server configuration (bind address, TLS, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{4};
    TlsConfig tls;
    LimitsConfig limits;
};

/// @brief Storage configuration for the local filesystem driver.
struct StorageConfig {
    std::string resident_path{"data/files"};
    std::string staging_path{"data/staging"};
    int lock_wait_ms{30000};
    int lock_lease_seconds{600};
};

/// @brief Background removal of abandoned staging uploads.
struct CleanupConfig {
    bool enabled{true};
    int period_seconds{3600};
    int expiration_seconds{86400};
    int batch_limit{100};
    int delete_workers{2};
    int delete_queue_capacity{256};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Top-level configuration for Harbor.
struct Config {
    ServerConfig server;
    StorageConfig storage;
    CleanupConfig cleanup;
    ObservabilityConfig observability;
};

/// @brief Load server configuration from a JSON file.
Config LoadConfig(const std::string& path);
/// @brief Load SQLite metadata DB path from a JSON file.
std::string LoadDatabasePath(const std::string& path);

}  // namespace harbor::core
