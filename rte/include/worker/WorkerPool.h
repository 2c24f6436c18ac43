// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RTE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RTE (Reconciliation Task Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE

#pragma once

#include "types.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace RTE {

/**
 * @brief Fixed-size thread pool running handler invocations
 *
 * Threads are started lazily on the first submit. Tasks run without any pool
 * lock held. A task that throws is logged and does not affect the other
 * threads.
 */
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t threads);

    /**
     * @brief Equivalent to shutdown(true)
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    /**
     * @brief Queue a task
     * @return false once shutdown has begun; the task is not queued
     */
    bool submit(Task task);

    /**
     * @brief Block until no task is queued or running, or the timeout passes
     * @return true if the pool went idle
     */
    bool waitIdle(Duration timeout);

    /**
     * @brief Stop accepting tasks without waiting for the threads
     *
     * @param dropQueued Discard tasks not yet started
     * @return Number of tasks discarded
     */
    size_t close(bool dropQueued);

    /**
     * @brief Stop accepting tasks and join the threads
     *
     * @param drain Run the tasks still queued before the threads exit; when
     *              false, queued tasks are dropped (running ones still finish)
     */
    void shutdown(bool drain = true);

    /**
     * @brief Tasks queued or running
     */
    size_t pending() const {
        return pending_;
    }

    size_t threadCount() const {
        return threadCount_;
    }

private:
    void ensureThreadsStarted();
    void workerMain();
    void finishTask();

    size_t threadCount_;
    std::vector<std::thread> threads_;
    std::once_flag threadsStartedFlag_;

    std::mutex queueMutex_;
    std::condition_variable queueCondition_;
    std::condition_variable idleCondition_;
    std::queue<Task> queue_;
    std::atomic<size_t> pending_{0};
    std::atomic<bool> accepting_{true};
    bool stopRequested_ = false;
};

}  // namespace RTE
