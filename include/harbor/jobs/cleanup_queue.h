#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "harbor/core/result.h"

namespace harbor::jobs {

/// @brief Bounded FIFO of object ids drained by a fixed pool of worker threads.
///
/// Used to delete the bytes of expired staging uploads. Producers block in
/// Enqueue while the queue is full, which caps both memory and the number of
/// concurrent filesystem operations during a large expiry burst.
class CleanupQueue {
public:
    using Task = std::function<core::Result<void>(const std::string& id)>;

    CleanupQueue(std::size_t capacity, int workers, Task task);
    ~CleanupQueue();

    CleanupQueue(const CleanupQueue&) = delete;
    CleanupQueue& operator=(const CleanupQueue&) = delete;

    /// @brief Queue `id`, waiting for space. Returns false once shut down.
    bool Enqueue(const std::string& id);
    /// @brief Stop accepting ids, drain what is queued and join the workers.
    void Shutdown();

    std::size_t capacity() const { return capacity_; }
    std::size_t pending() const;
    std::uint64_t completed() const;
    std::uint64_t failed() const;

private:
    void WorkerLoop();

    const std::size_t capacity_;
    Task task_;
    std::vector<std::thread> workers_;
    std::queue<std::string> ids_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool stopping_{false};
    std::uint64_t completed_{0};
    std::uint64_t failed_{0};
};

}  // namespace harbor::jobs
