#pragma once

#include <string>

#include "harbor/core/config.h"
#include "harbor/core/result.h"
#include "harbor/metadata/metadata_store.h"

namespace harbor::services {

/// How StagingLease::Acquire behaves while another writer holds the row.
enum class LeaseWait {
    kBlock,   ///< poll for up to storage.lock_wait_ms
    kNoWait,  ///< fail with kBusy after a single attempt
};

/// @brief Exclusive claim on one staging row, released on destruction.
///
/// While another writer holds a live lease on the row, Acquire either polls
/// (kBlock, for callers that own their thread) or returns kBusy at once so
/// the caller can retry without tying up a thread. Leases older than
/// `storage.lock_lease_seconds` are taken over, so a crashed holder cannot
/// block an upload forever.
class StagingLease {
public:
    static core::Result<StagingLease> Acquire(metadata::MetadataStore& store,
                                              const std::string& id,
                                              const core::StorageConfig& config,
                                              LeaseWait wait = LeaseWait::kBlock);

    StagingLease(StagingLease&& other) noexcept;
    StagingLease& operator=(StagingLease&& other) noexcept;
    StagingLease(const StagingLease&) = delete;
    StagingLease& operator=(const StagingLease&) = delete;
    ~StagingLease();

    const std::string& token() const { return token_; }
    /// Row as read when the lease was taken.
    const metadata::StagingFile& file() const { return file_; }

    /// @brief Release now instead of at destruction.
    void Release();

private:
    StagingLease(metadata::MetadataStore* store, std::string token, metadata::StagingFile file);

    metadata::MetadataStore* store_{nullptr};
    std::string token_;
    metadata::StagingFile file_;
};

}  // namespace harbor::services
