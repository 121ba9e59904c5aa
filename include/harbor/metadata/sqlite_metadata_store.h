#pragma once

#include <memory>
#include <string>

#include <Poco/Data/Session.h>
#include <Poco/Data/SessionPool.h>

#include "harbor/metadata/metadata_store.h"

namespace harbor::metadata {

/// @brief SQLite-backed metadata store for single-node mode.
///
/// Each call borrows a connection from a pool, so the store may be used from
/// all server threads at once.
class SqliteMetadataStore : public MetadataStore {
public:
    explicit SqliteMetadataStore(const std::string& db_path, int max_connections = 16);

    core::Result<StagingFile> CreateStagingFile(const StagingFile& file) override;
    core::Result<StagingFile> GetStagingFile(const std::string& id) override;
    core::Result<StagingFile> DeleteStagingFile(const std::string& id) override;

    core::Result<StagingFile> LockStagingFile(const std::string& id, const std::string& token,
                                              const std::string& stale_before) override;
    core::Result<void> UnlockStagingFile(const std::string& id,
                                         const std::string& token) override;
    core::Result<StagingFile> UpdateStagingFileSize(const std::string& id,
                                                    const std::string& token,
                                                    std::uint64_t size_bytes) override;

    core::Result<std::vector<std::string>> DeleteExpiredStagingFiles(
        const std::string& staged_before, const std::string& lease_stale_before,
        int limit) override;

    core::Result<FileRecord> PromoteStagingFile(
        const std::string& token, const FileRecord& file,
        const std::function<core::Result<void>()>& before_commit) override;

    core::Result<FileRecord> GetFile(const std::string& id) override;
    core::Result<FileRecord> DeleteFile(const std::string& id) override;

private:
    // Schema creation is done once per store instance; in production this will be migrated.
    void InitSchema();
    Poco::Data::Session Connect();

    std::unique_ptr<Poco::Data::SessionPool> pool_;
};

}  // namespace harbor::metadata
