/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#include "pubsubd/utils/worker_pool.hpp"
#include "pubsubd/utils/logger.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace pubsubd {
namespace utils {

WorkerPool::WorkerPool(size_t maxWorkers)
    : maxWorkers_(std::max<size_t>(maxWorkers, 1))
{}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return false;
    }

    // Every queued task must have a worker of its own waiting for it.
    if (tasks_.size() < idle_) {
        tasks_.push(std::move(task));
        condition_.notify_one();
        return true;
    }

    if (workers_.size() >= maxWorkers_) {
        return false;
    }

    tasks_.push(std::move(task));
    workers_.emplace_back(&WorkerPool::workerLoop, this);
    LOG_TRACE("WorkerPool", "Started worker {}/{}", workers_.size(), maxWorkers_);
    return true;
}

void WorkerPool::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ && workers_.empty()) {
            return;
        }
        running_ = false;
        workers.swap(workers_);
    }
    condition_.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    if (!workers.empty()) {
        LOG_DEBUG("WorkerPool", "Joined {} worker(s)", workers.size());
    }
}

size_t WorkerPool::workerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

void WorkerPool::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        ++idle_;
        condition_.wait(lock, [this]() { return !running_ || !tasks_.empty(); });
        --idle_;

        if (tasks_.empty()) {
            // Shut down with nothing left to run.
            return;
        }

        std::function<void()> task = std::move(tasks_.front());
        tasks_.pop();
        lock.unlock();

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("WorkerPool", "Task failed: {}", e.what());
        }

        lock.lock();
    }
}

}  // namespace utils
}  // namespace pubsubd
