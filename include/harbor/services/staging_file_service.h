#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include "harbor/core/config.h"
#include "harbor/core/result.h"
#include "harbor/jobs/cleanup_queue.h"
#include "harbor/metadata/metadata_store.h"
#include "harbor/services/staging_lease.h"
#include "harbor/storage/file_driver.h"

namespace harbor::services {

/// @brief One chunk being written into a staging upload under its lease.
///
/// Bytes reach disk as they are appended and Commit records the resulting
/// size. A fill that is aborted, dropped, or whose Append failed still leaves
/// the row equal to the bytes on disk. The lease is held until then.
class StagingFill {
public:
    StagingFill(StagingFill&&) = default;
    StagingFill& operator=(StagingFill&&) = delete;
    StagingFill(const StagingFill&) = delete;
    StagingFill& operator=(const StagingFill&) = delete;
    ~StagingFill();

    const std::string& id() const { return lease_.file().id; }

    /// @brief Write the next piece of the chunk. The fill is finished on failure.
    core::Result<void> Append(const char* data, std::size_t size);
    /// @brief Flush the chunk and record the new size.
    core::Result<metadata::StagingFile> Commit();
    /// @brief Stop without a response-worthy result; the row is reconciled.
    void Abort();

private:
    friend class StagingFileService;

    StagingFill(metadata::MetadataStore* store, StagingLease lease,
                std::unique_ptr<storage::StagingWriter> writer);

    core::Error Fail(const storage::WriteError& failure);
    void Reconcile(std::uint64_t observed_size);

    metadata::MetadataStore* store_;
    StagingLease lease_;
    std::unique_ptr<storage::StagingWriter> writer_;
    std::uint64_t before_;
};

/// @brief Lifecycle of in-progress uploads: create, chunked fill, cancel and expiry.
class StagingFileService {
public:
    StagingFileService(std::shared_ptr<metadata::MetadataStore> store,
                       std::shared_ptr<storage::FileDriver> driver,
                       std::shared_ptr<jobs::CleanupQueue> cleanup_queue,
                       core::StorageConfig config);

    core::Result<metadata::StagingFile> Create(const std::string& name,
                                               const std::optional<std::string>& mime);
    core::Result<metadata::StagingFile> Get(const std::string& id);

    /// @brief Write one chunk at `offset` and record the resulting size.
    ///
    /// Chunk writes to one id are serialized through the row lease. Fails with
    /// kNotFound without touching storage when the upload does not exist,
    /// kOutOfRange for rejected offsets and kIoError for failed writes; after a
    /// failed write the row still reflects the bytes actually on disk.
    core::Result<metadata::StagingFile> Fill(const std::string& id, std::uint64_t offset,
                                             std::istream& data);

    /// @brief Take the lease and open the staging object for a chunk at `offset`.
    ///
    /// Offsets are validated here, before any byte is accepted. With
    /// LeaseWait::kNoWait a held row fails with kBusy instead of blocking.
    core::Result<StagingFill> BeginFill(const std::string& id, std::uint64_t offset,
                                        LeaseWait wait = LeaseWait::kBlock);

    /// @brief Delete the upload row, and its bytes when `delete_bytes` is set.
    core::Result<metadata::StagingFile> Remove(const std::string& id, bool delete_bytes,
                                               LeaseWait wait = LeaseWait::kBlock);

    /// @brief Delete up to `limit` uploads older than `max_age_seconds`, oldest first.
    ///
    /// Rows are deleted before this returns; their bytes are handed to the
    /// cleanup queue. Returns the number of rows deleted.
    core::Result<std::size_t> RemoveExpired(long long max_age_seconds, int limit);

private:
    std::shared_ptr<metadata::MetadataStore> store_;
    std::shared_ptr<storage::FileDriver> driver_;
    std::shared_ptr<jobs::CleanupQueue> cleanup_queue_;
    core::StorageConfig config_;
};

}  // namespace harbor::services
