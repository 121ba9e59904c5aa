#include "harbor/services/staging_lease.h"

#include <chrono>
#include <thread>

#include "harbor/core/ids.h"
#include "harbor/core/logger.h"
#include "harbor/core/time.h"

namespace harbor::services {

namespace {
constexpr auto kPollInterval = std::chrono::milliseconds(20);
}  // namespace

core::Result<StagingLease> StagingLease::Acquire(metadata::MetadataStore& store,
                                                 const std::string& id,
                                                 const core::StorageConfig& config,
                                                 LeaseWait wait) {
    const auto token = core::GenerateRequestId();
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(config.lock_wait_ms);

    while (true) {
        const auto stale_before = core::NowIso8601WithOffsetSeconds(-config.lock_lease_seconds);
        auto locked = store.LockStagingFile(id, token, stale_before);
        if (locked.ok()) {
            return StagingLease(&store, token, locked.value());
        }
        if (locked.error().code != core::ErrorCode::kConflict) {
            return locked.error();
        }
        if (wait == LeaseWait::kNoWait || std::chrono::steady_clock::now() >= deadline) {
            return core::Error{core::ErrorCode::kBusy,
                               "staging file " + id + " is in use by another request"};
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

StagingLease::StagingLease(metadata::MetadataStore* store, std::string token,
                           metadata::StagingFile file)
    : store_(store), token_(std::move(token)), file_(std::move(file)) {}

StagingLease::StagingLease(StagingLease&& other) noexcept
    : store_(other.store_), token_(std::move(other.token_)), file_(std::move(other.file_)) {
    other.store_ = nullptr;
}

StagingLease& StagingLease::operator=(StagingLease&& other) noexcept {
    if (this != &other) {
        Release();
        store_ = other.store_;
        token_ = std::move(other.token_);
        file_ = std::move(other.file_);
        other.store_ = nullptr;
    }
    return *this;
}

StagingLease::~StagingLease() { Release(); }

void StagingLease::Release() {
    if (!store_) {
        return;
    }
    auto* store = store_;
    store_ = nullptr;
    auto result = store->UnlockStagingFile(file_.id, token_);
    if (!result.ok()) {
        // The lease goes stale after lock_lease_seconds and is taken over then.
        core::LogWarning("Failed to release lease on staging file " + file_.id + ": " +
                         result.error().message);
    }
}

}  // namespace harbor::services
