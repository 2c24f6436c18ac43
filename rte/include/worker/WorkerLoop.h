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

#include "common/EngineConfig.h"
#include "common/IClock.h"
#include "lease/LeaseManager.h"
#include "runtime/DispatchStats.h"
#include "runtime/GraphRegistry.h"
#include "scheduler/ReadinessScheduler.h"
#include "storage/IEntityRepository.h"
#include "worker/WorkerPool.h"
#include "types.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace RTE {

/**
 * @brief How a run ended
 */
enum class RunOutcome {
    CLEAN,             // Drained (or the manual pass finished) with nothing in flight
    DRAIN_TIMED_OUT,   // Grace period elapsed with handlers still running
    FORCED,            // Second shutdown request; in-flight leases left to expire
    SCHEDULER_STALLED  // No readiness round finished within two schedule intervals
};

inline const char *toString(RunOutcome outcome) {
    switch (outcome) {
    case RunOutcome::CLEAN:
        return "clean";
    case RunOutcome::DRAIN_TIMED_OUT:
        return "drain timed out";
    case RunOutcome::FORCED:
        return "forced";
    case RunOutcome::SCHEDULER_STALLED:
        return "scheduler stalled";
    }
    return "unknown";
}

/**
 * @brief Summary of one run() or runOnce() call
 */
struct RunStats {
    std::map<std::string, size_t> handled;  // Invocations per entity type
    size_t transitions = 0;
    size_t failures = 0;
    size_t lostLeases = 0;
    RunOutcome outcome = RunOutcome::CLEAN;

    size_t totalHandled() const {
        size_t total = 0;
        for (const auto &[type, count] : handled) {
            total += count;
        }
        return total;
    }
};

/**
 * @brief Reconciliation loop: selects, leases and dispatches ready entities
 *
 * Each iteration visits the registered types in rotating order, fetches ready
 * entities in automatic states up to the free capacity (global and per type),
 * leases them, flags them not ready and hands them to the WorkerPool. The
 * invocation re-reads the entity, runs the handler (or takes an elapsed
 * timeout), then applies the outcome and drops the lease in one conditional
 * update. A result whose lease was lost is discarded.
 *
 * Lifecycle: RUNNING -> DRAINING on the first shutdown request, STOPPED once
 * in-flight handlers finished or the grace period elapsed. A second request
 * stops at once. Sleeping and the grace period use the monotonic clock; lease
 * and scheduling times use the injected IClock.
 *
 * With the watchdog enabled, run() gives up with SCHEDULER_STALLED when the
 * readiness thread finishes no round for two schedule intervals. The stuck
 * thread is not joined; the owner is expected to exit the process.
 *
 * Several loops (threads or processes) may share one store.
 */
class WorkerLoop {
public:
    WorkerLoop(std::shared_ptr<IEntityRepository> repository, std::shared_ptr<const GraphRegistry> graphs,
               std::shared_ptr<IClock> clock, EngineConfig config);

    /**
     * @brief Waits for handlers still executing on the pool
     */
    ~WorkerLoop();

    WorkerLoop(const WorkerLoop &) = delete;
    WorkerLoop &operator=(const WorkerLoop &) = delete;

    /**
     * @brief Dispatch until shut down or until run_for elapses
     *
     * Starts the readiness scheduler thread for the duration of the run.
     * After SCHEDULER_STALLED the destructor blocks until the stuck pass
     * returns.
     * @throws std::logic_error if the loop already stopped
     */
    RunStats run();

    /**
     * @brief One synchronous pass: readiness pass, dispatch, wait for completion
     *
     * @throws StorageError if the store is unavailable
     * @throws std::logic_error if the loop already stopped
     */
    RunStats runOnce();

    /**
     * @brief Ask the loop to stop; the second call forces it
     *
     * Only touches an atomic counter, so it is safe from a signal handler.
     */
    void requestShutdown() noexcept {
        shutdownRequests_.fetch_add(1);
    }

    WorkerState state() const {
        return state_;
    }

    /**
     * @brief Handlers currently leased and queued or running
     */
    size_t inFlight() const;

    const std::shared_ptr<DispatchStats> &stats() const {
        return stats_;
    }

    ReadinessScheduler &scheduler() {
        return *scheduler_;
    }

    LeaseManager &leases() {
        return leases_;
    }

private:
    size_t dispatchPass();
    bool dispatch(const std::shared_ptr<const StateGraph> &graph, const EntityRecord &record);
    void invoke(const std::shared_ptr<const StateGraph> &graph, Lease lease);
    void finishInvocation(const std::string &type);
    size_t freeSlots(const std::string &type) const;

    bool waitForIdle();
    RunOutcome drain();
    RunOutcome abandon();
    void sleepFor(Duration delay);
    bool forceRequested() const {
        return shutdownRequests_.load() >= 2;
    }

    void recordHandled(const std::string &type);
    void recordTransition(const std::string &type);
    void recordFailure(const std::string &type);
    void recordLostLease(const std::string &type);
    RunStats takeRunStats(RunOutcome outcome);

    std::shared_ptr<IEntityRepository> repository_;
    std::shared_ptr<const GraphRegistry> graphs_;
    std::shared_ptr<IClock> clock_;
    EngineConfig config_;
    LeaseManager leases_;
    std::shared_ptr<DispatchStats> stats_;
    std::unique_ptr<ReadinessScheduler> scheduler_;
    std::unique_ptr<WorkerPool> pool_;

    std::atomic<WorkerState> state_{WorkerState::RUNNING};
    std::atomic<int> shutdownRequests_{0};
    size_t rotation_ = 0;

    mutable std::mutex inFlightMutex_;
    std::condition_variable idleCondition_;
    std::map<std::string, size_t> inFlightByType_;
    size_t inFlightTotal_ = 0;

    std::mutex runStatsMutex_;
    RunStats runStats_;
};

}  // namespace RTE
