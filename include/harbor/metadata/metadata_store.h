#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "harbor/core/error.h"
#include "harbor/core/result.h"

namespace harbor::metadata {

/// @brief In-progress upload. `size_bytes` mirrors the bytes in the staging object.
struct StagingFile {
    std::string id;
    std::string name;
    std::optional<std::string> mime;
    std::uint64_t size_bytes{0};
    std::string staged_at;
};

/// @brief Resident file produced by promoting a staging upload; shares its id.
struct FileRecord {
    std::string id;
    std::string name;
    std::string mime;
    std::uint64_t size_bytes{0};
    std::string hash;
    std::string created_at;
};

/// @brief Abstract metadata store for staging uploads and resident files.
///
/// Writers of one staging row coordinate through a lease stored in the row
/// itself (LockStagingFile / UnlockStagingFile), so the exclusion holds for
/// every process sharing the database.
class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    /// @brief Insert a staging row; `file.size_bytes` is ignored and stored as 0.
    virtual core::Result<StagingFile> CreateStagingFile(const StagingFile& file) = 0;
    virtual core::Result<StagingFile> GetStagingFile(const std::string& id) = 0;
    /// @brief Delete a staging row regardless of any lease and return it.
    virtual core::Result<StagingFile> DeleteStagingFile(const std::string& id) = 0;

    /// @brief Claim the row for `token`.
    ///
    /// Fails with kNotFound when the row does not exist and kConflict while a
    /// different lease taken at or after `stale_before` is held.
    virtual core::Result<StagingFile> LockStagingFile(const std::string& id,
                                                      const std::string& token,
                                                      const std::string& stale_before) = 0;
    virtual core::Result<void> UnlockStagingFile(const std::string& id,
                                                 const std::string& token) = 0;
    /// @brief Record the observed size; requires the lease held by `token`.
    virtual core::Result<StagingFile> UpdateStagingFileSize(const std::string& id,
                                                            const std::string& token,
                                                            std::uint64_t size_bytes) = 0;

    /// @brief Delete up to `limit` rows staged before `staged_before`, oldest first.
    ///
    /// Rows whose lease is still live (taken at or after `lease_stale_before`)
    /// are skipped. Returns the ids of the deleted rows.
    virtual core::Result<std::vector<std::string>> DeleteExpiredStagingFiles(
        const std::string& staged_before, const std::string& lease_stale_before, int limit) = 0;

    /// @brief Atomically replace the leased staging row `file.id` with a file row.
    ///
    /// `before_commit` runs inside the transaction after both statements
    /// succeeded; an error from it rolls everything back.
    virtual core::Result<FileRecord> PromoteStagingFile(
        const std::string& token, const FileRecord& file,
        const std::function<core::Result<void>()>& before_commit) = 0;

    virtual core::Result<FileRecord> GetFile(const std::string& id) = 0;
    virtual core::Result<FileRecord> DeleteFile(const std::string& id) = 0;
};

}  // namespace harbor::metadata
