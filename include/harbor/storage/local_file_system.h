#pragma once

#include <memory>
#include <string>

#include "harbor/storage/file_driver.h"

namespace harbor::storage {

/// @brief FileDriver backed by two local directories.
///
/// Staging and resident objects are plain files named by id under their
/// respective roots. When both roots live on the same device, promotion is a
/// rename; otherwise the staging file is copied and then removed.
class LocalFileSystem : public FileDriver {
public:
    /// How CommitStaging moves bytes. kAuto decides from the roots' device ids.
    enum class CommitMode {
        kAuto,
        kRename,
        kCopy,
    };

    LocalFileSystem(std::string resident_path, std::string staging_path,
                    CommitMode mode = CommitMode::kAuto);

    core::Result<std::unique_ptr<StagingWriter>, WriteError> OpenStaging(
        const std::string& id, std::uint64_t offset) override;
    core::Result<void> RemoveStaging(const std::string& id) override;
    core::Result<std::string> ReadStaging(const std::string& id) override;
    core::Result<void> CommitStaging(const std::string& id) override;

    core::Result<void> Remove(const std::string& id) override;
    core::Result<ObjectReader, ReadError> Read(const std::string& id,
                                               const ByteRange& range) override;

    const std::string& resident_path() const { return resident_path_; }
    const std::string& staging_path() const { return staging_path_; }
    bool copies_on_commit() const { return copy_on_commit_; }

    std::string StagingObjectPath(const std::string& id) const;
    std::string ResidentObjectPath(const std::string& id) const;

    static bool IsSafeName(const std::string& name);

private:
    core::Result<void> CopyIntoResident(const std::string& id);

    std::string resident_path_;
    std::string staging_path_;
    bool copy_on_commit_{true};
};

}  // namespace harbor::storage
