#include "harbor/jobs/staging_file_remover.h"

#include <chrono>

#include <boost/asio/post.hpp>

#include "harbor/core/logger.h"
#include "harbor/observability/metrics.h"

namespace harbor::jobs {

namespace net = boost::asio;

StagingFileRemover::StagingFileRemover(net::io_context& ioc,
                                       std::shared_ptr<services::StagingFileService> staging,
                                       core::CleanupConfig config)
    : staging_(std::move(staging)),
      config_(std::move(config)),
      strand_(net::make_strand(ioc)),
      timer_(strand_) {}

void StagingFileRemover::Start() {
    core::LogInfo("Staging cleanup every " + std::to_string(config_.period_seconds) +
                  "s, expiring uploads older than " +
                  std::to_string(config_.expiration_seconds) + "s");
    net::post(strand_, [this]() { ScheduleNext(); });
}

void StagingFileRemover::Stop() {
    std::unique_lock<std::mutex> lock(mutex_);
    stopped_ = true;
    net::post(strand_, [this]() { timer_.cancel(); });
    idle_.wait(lock, [this] { return !sweeping_; });
}

void StagingFileRemover::ScheduleNext() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
    }
    timer_.expires_after(std::chrono::seconds(config_.period_seconds));
    timer_.async_wait([this](const boost::system::error_code& ec) { OnTick(ec); });
}

void StagingFileRemover::OnTick(const boost::system::error_code& ec) {
    if (ec) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
    }
    // Failures are logged by SweepOnce; the next tick retries.
    SweepOnce();
    ScheduleNext();
}

core::Result<std::size_t> StagingFileRemover::SweepOnce() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this] { return !sweeping_; });
        sweeping_ = true;
    }

    auto removed = staging_->RemoveExpired(config_.expiration_seconds, config_.batch_limit);
    if (removed.ok()) {
        observability::RecordSweep(removed.value());
        if (removed.value() > 0) {
            core::LogInfo("Removed " + std::to_string(removed.value()) +
                          " expired staging files");
        } else {
            core::LogDebug("No expired staging files");
        }
    } else {
        observability::RecordSweep(0);
        core::LogWarning("Staging cleanup sweep failed: " + removed.error().message);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sweeping_ = false;
    }
    idle_.notify_all();
    return removed;
}

}  // namespace harbor::jobs
