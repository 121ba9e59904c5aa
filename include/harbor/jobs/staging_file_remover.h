#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "harbor/core/config.h"
#include "harbor/core/result.h"
#include "harbor/services/staging_file_service.h"

namespace harbor::jobs {

/// @brief Periodically removes staging uploads older than the configured expiration.
///
/// Ticks run on the server's io_context. A failed sweep is logged and the
/// next tick runs as usual.
class StagingFileRemover {
public:
    StagingFileRemover(boost::asio::io_context& ioc,
                       std::shared_ptr<services::StagingFileService> staging,
                       core::CleanupConfig config);

    StagingFileRemover(const StagingFileRemover&) = delete;
    StagingFileRemover& operator=(const StagingFileRemover&) = delete;

    void Start();
    /// @brief Cancel future ticks and wait for a sweep that is already running.
    void Stop();
    /// @brief Run one sweep on the calling thread; returns the number of rows removed.
    core::Result<std::size_t> SweepOnce();

private:
    void ScheduleNext();
    void OnTick(const boost::system::error_code& ec);

    std::shared_ptr<services::StagingFileService> staging_;
    core::CleanupConfig config_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;

    std::mutex mutex_;
    std::condition_variable idle_;
    bool stopped_{false};
    bool sweeping_{false};
};

}  // namespace harbor::jobs
