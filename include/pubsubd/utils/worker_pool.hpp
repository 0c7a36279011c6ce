/**
 * @file worker_pool.hpp
 * @brief Bounded pool of threads for long-running blocking tasks.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include "pubsubd/utils/export.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace pubsubd {
namespace utils {

/**
 * @class WorkerPool
 * @brief Runs tasks on at most maxWorkers threads, spawned on demand.
 *
 * Tasks are expected to block for a long time, so the pool never queues
 * a task behind a busy worker: submit() either hands it to an idle
 * worker, starts a new one, or refuses it when every worker is busy.
 *
 * Usage:
 * @code
 * WorkerPool pool(64);
 * if (!pool.submit([]() { waitForSomething(); })) {
 *     // Saturated; fail the request instead.
 * }
 * pool.shutdown();  // Runs what was accepted, then joins
 * @endcode
 */
class PUBSUBD_UTILS_API WorkerPool {
public:
    explicit WorkerPool(size_t maxWorkers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @return false if the pool is shut down or every worker is busy.
     */
    bool submit(std::function<void()> task);

    /**
     * @brief Finish accepted tasks and join every worker. Idempotent.
     */
    void shutdown();

    size_t maxWorkers() const { return maxWorkers_; }

    /**
     * @brief Threads started so far (busy or idle).
     */
    size_t workerCount() const;

private:
    void workerLoop();

    const size_t maxWorkers_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::queue<std::function<void()>> tasks_;
    std::vector<std::thread> workers_;
    size_t idle_ = 0;
    bool running_ = true;
};

}  // namespace utils
}  // namespace pubsubd
