#include "harbor/services/staging_file_service.h"

#include <array>
#include <string>

#include "harbor/core/ids.h"
#include "harbor/core/logger.h"
#include "harbor/core/time.h"
#include "harbor/observability/metrics.h"

namespace harbor::services {

StagingFill::StagingFill(metadata::MetadataStore* store, StagingLease lease,
                         std::unique_ptr<storage::StagingWriter> writer)
    : store_(store),
      lease_(std::move(lease)),
      writer_(std::move(writer)),
      before_(lease_.file().size_bytes) {}

StagingFill::~StagingFill() { Abort(); }

core::Result<void> StagingFill::Append(const char* data, std::size_t size) {
    if (!writer_) {
        return core::Error{core::ErrorCode::kInternal, "chunk is already finished"};
    }
    auto appended = writer_->Append(data, size);
    if (!appended.ok()) {
        return Fail(appended.error());
    }
    return core::Ok();
}

core::Result<metadata::StagingFile> StagingFill::Commit() {
    if (!writer_) {
        return core::Error{core::ErrorCode::kInternal, "chunk is already finished"};
    }
    auto finished = writer_->Finish();
    if (!finished.ok()) {
        return Fail(finished.error());
    }
    writer_.reset();

    const auto size = finished.value();
    auto updated = store_->UpdateStagingFileSize(id(), lease_.token(), size);
    lease_.Release();
    if (!updated.ok()) {
        return updated.error();
    }
    if (size > before_) {
        observability::RecordStagedBytes(size - before_);
    }
    return updated;
}

void StagingFill::Abort() {
    if (!writer_) {
        return;
    }
    auto finished = writer_->Finish();
    writer_.reset();
    const auto observed = finished.ok() ? finished.value() : finished.error().observed_size;
    core::LogWarning("Chunk for staging file " + id() + " abandoned at " +
                     std::to_string(observed) + " bytes");
    Reconcile(observed);
    lease_.Release();
}

core::Error StagingFill::Fail(const storage::WriteError& failure) {
    writer_.reset();
    Reconcile(failure.observed_size);
    lease_.Release();
    return failure.ToError();
}

void StagingFill::Reconcile(std::uint64_t observed_size) {
    if (observed_size == before_) {
        return;
    }
    // Part of the chunk landed; keep the row equal to the bytes on disk.
    auto reconciled = store_->UpdateStagingFileSize(id(), lease_.token(), observed_size);
    if (!reconciled.ok()) {
        core::LogError("Failed to record size of staging file " + id() +
                       " after an incomplete write: " + reconciled.error().message);
    }
}

StagingFileService::StagingFileService(std::shared_ptr<metadata::MetadataStore> store,
                                       std::shared_ptr<storage::FileDriver> driver,
                                       std::shared_ptr<jobs::CleanupQueue> cleanup_queue,
                                       core::StorageConfig config)
    : store_(std::move(store)),
      driver_(std::move(driver)),
      cleanup_queue_(std::move(cleanup_queue)),
      config_(std::move(config)) {}

core::Result<metadata::StagingFile> StagingFileService::Create(
    const std::string& name, const std::optional<std::string>& mime) {
    if (name.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "name must not be empty"};
    }
    metadata::StagingFile file;
    file.id = core::GenerateObjectId();
    file.name = name;
    if (mime && !mime->empty()) {
        file.mime = mime;
    }
    return store_->CreateStagingFile(file);
}

core::Result<metadata::StagingFile> StagingFileService::Get(const std::string& id) {
    return store_->GetStagingFile(id);
}

core::Result<metadata::StagingFile> StagingFileService::Fill(const std::string& id,
                                                             std::uint64_t offset,
                                                             std::istream& data) {
    auto begun = BeginFill(id, offset);
    if (!begun.ok()) {
        return begun.error();
    }
    auto& fill = begun.value();

    std::array<char, 8192> buffer{};
    while (data) {
        data.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize bytes = data.gcount();
        if (bytes <= 0) {
            break;
        }
        auto appended = fill.Append(buffer.data(), static_cast<std::size_t>(bytes));
        if (!appended.ok()) {
            return appended.error();
        }
    }
    if (data.bad()) {
        fill.Abort();
        return core::Error{core::ErrorCode::kIoError, "failed to read upload stream"};
    }
    return fill.Commit();
}

core::Result<StagingFill> StagingFileService::BeginFill(const std::string& id,
                                                         std::uint64_t offset, LeaseWait wait) {
    auto lease = StagingLease::Acquire(*store_, id, config_, wait);
    if (!lease.ok()) {
        return lease.error();
    }
    auto writer = driver_->OpenStaging(id, offset);
    if (!writer.ok()) {
        return writer.error().ToError();
    }
    return StagingFill(store_.get(), std::move(lease.value()), std::move(writer.value()));
}

core::Result<metadata::StagingFile> StagingFileService::Remove(const std::string& id,
                                                               bool delete_bytes,
                                                               LeaseWait wait) {
    // Wait for an in-flight chunk so its bytes are not recreated after removal.
    auto lease = StagingLease::Acquire(*store_, id, config_, wait);
    if (!lease.ok()) {
        return lease.error();
    }
    auto removed = store_->DeleteStagingFile(id);
    if (!removed.ok()) {
        return removed.error();
    }
    if (delete_bytes) {
        auto bytes = driver_->RemoveStaging(id);
        if (!bytes.ok()) {
            core::LogWarning("Failed to remove staged bytes of " + id + ": " +
                             bytes.error().message);
        }
    }
    return removed;
}

core::Result<std::size_t> StagingFileService::RemoveExpired(long long max_age_seconds,
                                                            int limit) {
    const auto staged_before = core::NowIso8601WithOffsetSeconds(-max_age_seconds);
    const auto lease_stale_before =
        core::NowIso8601WithOffsetSeconds(-static_cast<long long>(config_.lock_lease_seconds));
    auto expired = store_->DeleteExpiredStagingFiles(staged_before, lease_stale_before, limit);
    if (!expired.ok()) {
        return expired.error();
    }
    for (const auto& id : expired.value()) {
        if (!cleanup_queue_->Enqueue(id)) {
            core::LogWarning("Cleanup queue is shut down; staged bytes of " + id + " are left");
        }
    }
    return expired.value().size();
}

}  // namespace harbor::services
