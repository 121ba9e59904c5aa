#include "harbor/jobs/cleanup_queue.h"

#include <algorithm>

#include "harbor/core/logger.h"

namespace harbor::jobs {

CleanupQueue::CleanupQueue(std::size_t capacity, int workers, Task task)
    : capacity_(std::max<std::size_t>(capacity, 1)), task_(std::move(task)) {
    const int count = std::max(workers, 1);
    workers_.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        workers_.emplace_back([this] { WorkerLoop(); });
    }
}

CleanupQueue::~CleanupQueue() { Shutdown(); }

bool CleanupQueue::Enqueue(const std::string& id) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return stopping_ || ids_.size() < capacity_; });
        if (stopping_) {
            return false;
        }
        ids_.push(id);
    }
    not_empty_.notify_one();
    return true;
}

void CleanupQueue::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

std::size_t CleanupQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ids_.size();
}

std::uint64_t CleanupQueue::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

std::uint64_t CleanupQueue::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

void CleanupQueue::WorkerLoop() {
    while (true) {
        std::string id;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait(lock, [this] { return stopping_ || !ids_.empty(); });
            // Drain before exiting so ids queued ahead of shutdown are not leaked.
            if (ids_.empty()) {
                return;
            }
            id = std::move(ids_.front());
            ids_.pop();
        }
        not_full_.notify_one();

        auto result = task_(id);
        if (!result.ok()) {
            core::LogWarning("Failed to remove staged bytes of " + id + ": " +
                             result.error().message);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.ok()) {
            ++completed_;
        } else {
            ++failed_;
        }
    }
}

}  // namespace harbor::jobs
