#include "harbor/services/file_service.h"

#include "harbor/core/logger.h"
#include "harbor/observability/metrics.h"
#include "harbor/services/content_inspector.h"
#include "harbor/services/staging_lease.h"

namespace harbor::services {

FileService::FileService(std::shared_ptr<metadata::MetadataStore> store,
                         std::shared_ptr<storage::FileDriver> driver,
                         std::shared_ptr<SearchIndexer> indexer, core::StorageConfig config)
    : store_(std::move(store)),
      driver_(std::move(driver)),
      indexer_(std::move(indexer)),
      config_(std::move(config)) {}

core::Result<metadata::FileRecord> FileService::Promote(const std::string& staging_id,
                                                        LeaseWait wait) {
    // Holding the lease keeps chunk writes out while the bytes are inspected and moved.
    auto lease = StagingLease::Acquire(*store_, staging_id, config_, wait);
    if (!lease.ok()) {
        return lease.error();
    }
    const auto& staged = lease.value().file();

    auto path = driver_->ReadStaging(staging_id);
    if (!path.ok()) {
        if (path.error().code == core::ErrorCode::kNotFound) {
            return core::Error{core::ErrorCode::kNotYetFilled,
                               "staging file " + staging_id + " has no content yet"};
        }
        return path.error();
    }

    auto content = InspectContent(path.value(), staged.name, staged.mime);
    if (!content.ok()) {
        return content.error();
    }
    if (content.value().size_bytes != staged.size_bytes) {
        core::LogWarning("Staging file " + staging_id + " records " +
                         std::to_string(staged.size_bytes) + " bytes but holds " +
                         std::to_string(content.value().size_bytes));
    }

    metadata::FileRecord file;
    file.id = staging_id;
    file.name = staged.name;
    file.mime = content.value().mime;
    file.size_bytes = content.value().size_bytes;
    file.hash = content.value().hash;

    auto promoted = store_->PromoteStagingFile(
        lease.value().token(), file, [this, &staging_id]() {
            return driver_->CommitStaging(staging_id);
        });
    if (!promoted.ok()) {
        return promoted.error();
    }
    observability::RecordPromotion();
    core::LogInfo("Promoted staging file " + staging_id + " (" +
                  std::to_string(file.size_bytes) + " bytes, " + file.mime + ")");

    if (indexer_) {
        auto indexed = indexer_->Index(promoted.value());
        if (!indexed.ok()) {
            core::LogWarning("Failed to index file " + staging_id + ": " +
                             indexed.error().message);
        }
    }
    return promoted;
}

core::Result<metadata::FileRecord> FileService::Get(const std::string& id) {
    return store_->GetFile(id);
}

core::Result<storage::ObjectReader> FileService::Read(const std::string& id,
                                                      const storage::ByteRange& range) {
    auto reader = driver_->Read(id, range);
    if (!reader.ok()) {
        return reader.error().ToError();
    }
    return std::move(reader.value());
}

core::Result<metadata::FileRecord> FileService::Remove(const std::string& id) {
    auto removed = store_->DeleteFile(id);
    if (!removed.ok()) {
        return removed.error();
    }
    auto bytes = driver_->Remove(id);
    if (!bytes.ok()) {
        core::LogWarning("Failed to remove bytes of file " + id + ": " + bytes.error().message);
    }
    return removed;
}

}  // namespace harbor::services
