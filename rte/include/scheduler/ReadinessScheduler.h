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

#include "common/IClock.h"
#include "runtime/DispatchStats.h"
#include "runtime/GraphRegistry.h"
#include "storage/IEntityRepository.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace RTE {

/**
 * @brief Outcome of one readiness pass
 */
struct ReadinessPassResult {
    size_t markedReady = 0;
    size_t leasesCleared = 0;
    std::map<std::string, size_t> readyCounts;  // Per type, after the pass
};

/**
 * @brief Periodic pass that makes retry-eligible entities dispatchable again
 *
 * For every automatic state with a try interval, flips ready = false to true
 * on entities never attempted in that state or last attempted at least one
 * interval ago. States without a try interval (and manual-only states) are
 * only re-armed by external triggers. The pass holds no lease and only moves
 * the flag forward, so concurrent schedulers are harmless.
 *
 * Runs on its own timer thread (start/stop) and on demand (runPass).
 */
class ReadinessScheduler {
public:
    ReadinessScheduler(std::shared_ptr<IEntityRepository> repository, std::shared_ptr<const GraphRegistry> graphs,
                       std::shared_ptr<IClock> clock, Duration interval);
    ~ReadinessScheduler();

    ReadinessScheduler(const ReadinessScheduler &) = delete;
    ReadinessScheduler &operator=(const ReadinessScheduler &) = delete;

    /**
     * @brief Counters to flush into the log on every pass
     */
    void setStats(std::shared_ptr<DispatchStats> stats) {
        stats_ = std::move(stats);
    }

    /**
     * @brief File that receives the Unix time after every successful pass
     */
    void setLivenessFile(std::string path) {
        livenessFile_ = std::move(path);
    }

    /**
     * @brief One pass at the clock's current time
     * @throws StorageError if the store is unavailable
     */
    ReadinessPassResult runPass();

    /**
     * @brief One pass at an explicit time
     * @throws StorageError if the store is unavailable
     */
    ReadinessPassResult runPass(Timestamp now);

    /**
     * @brief Start the timer thread; the first pass runs immediately
     */
    void start();

    /**
     * @brief Stop and join the timer thread (idempotent)
     */
    void stop();

    bool isRunning() const {
        return running_;
    }

    size_t completedPasses() const {
        return completedPasses_;
    }

    /**
     * @brief Timer-thread rounds finished, failed passes included
     *
     * Stops advancing only while a pass is stuck inside the store.
     */
    size_t finishedRounds() const {
        return finishedRounds_;
    }

private:
    void timerThreadMain();
    void flushStats(const ReadinessPassResult &result);
    void writeLivenessFile();

    std::shared_ptr<IEntityRepository> repository_;
    std::shared_ptr<const GraphRegistry> graphs_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<DispatchStats> stats_;
    Duration interval_;
    std::string livenessFile_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdownRequested_{false};
    std::atomic<size_t> completedPasses_{0};
    std::atomic<size_t> finishedRounds_{0};
    std::mutex timerMutex_;
    std::condition_variable timerCondition_;
    std::thread timerThread_;
};

}  // namespace RTE
