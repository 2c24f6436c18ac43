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

#include "worker/WorkerPool.h"
#include "common/Logger.h"

#include <stdexcept>

namespace RTE {

WorkerPool::WorkerPool(size_t threads) : threadCount_(threads) {
    if (threads == 0) {
        throw std::invalid_argument("WorkerPool requires at least one thread");
    }
}

WorkerPool::~WorkerPool() {
    shutdown(true);
}

void WorkerPool::ensureThreadsStarted() {
    std::call_once(threadsStartedFlag_, [this]() {
        threads_.reserve(threadCount_);
        for (size_t i = 0; i < threadCount_; ++i) {
            threads_.emplace_back(&WorkerPool::workerMain, this);
        }
        LOG_DEBUG("WorkerPool: Started {} worker threads", threadCount_);
    });
}

bool WorkerPool::submit(Task task) {
    if (!task) {
        throw std::invalid_argument("WorkerPool: task cannot be empty");
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!accepting_) {
            return false;
        }
        queue_.push(std::move(task));
        pending_++;
    }
    ensureThreadsStarted();
    queueCondition_.notify_one();
    return true;
}

bool WorkerPool::waitIdle(Duration timeout) {
    std::unique_lock<std::mutex> lock(queueMutex_);
    return idleCondition_.wait_for(lock, timeout, [this] { return pending_.load() == 0; });
}

size_t WorkerPool::close(bool dropQueued) {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        accepting_ = false;
        stopRequested_ = true;
        if (dropQueued) {
            dropped = queue_.size();
            std::queue<Task> empty;
            queue_.swap(empty);
            pending_ -= dropped;
        }
    }
    queueCondition_.notify_all();
    idleCondition_.notify_all();

    if (dropped > 0) {
        LOG_WARN("WorkerPool: Dropped {} queued tasks", dropped);
    }
    return dropped;
}

void WorkerPool::shutdown(bool drain) {
    close(!drain);

    for (auto &thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::workerMain() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCondition_.wait(lock, [this] { return !queue_.empty() || stopRequested_; });
            if (queue_.empty()) {
                // Stop requested and nothing left to run
                break;
            }
            task = std::move(queue_.front());
            queue_.pop();
        }

        try {
            task();
        } catch (const std::exception &e) {
            LOG_ERROR("WorkerPool: Task failed: {}", e.what());
        } catch (...) {
            LOG_ERROR("WorkerPool: Task failed with a non-standard exception");
        }
        finishTask();
    }
}

void WorkerPool::finishTask() {
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (--pending_ == 0) {
        idleCondition_.notify_all();
    }
}

}  // namespace RTE
