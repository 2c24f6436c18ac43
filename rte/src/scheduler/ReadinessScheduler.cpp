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

#include "scheduler/ReadinessScheduler.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <ctime>
#include <fstream>
#include <stdexcept>

namespace RTE {

ReadinessScheduler::ReadinessScheduler(std::shared_ptr<IEntityRepository> repository,
                                       std::shared_ptr<const GraphRegistry> graphs, std::shared_ptr<IClock> clock,
                                       Duration interval)
    : repository_(std::move(repository)), graphs_(std::move(graphs)), clock_(std::move(clock)), interval_(interval) {
    if (!repository_ || !graphs_ || !clock_) {
        throw std::invalid_argument("ReadinessScheduler requires a repository, graphs and a clock");
    }
    if (interval_ <= Duration::zero()) {
        throw std::invalid_argument("ReadinessScheduler: interval must be positive");
    }
}

ReadinessScheduler::~ReadinessScheduler() {
    stop();
}

ReadinessPassResult ReadinessScheduler::runPass() {
    return runPass(clock_->now());
}

ReadinessPassResult ReadinessScheduler::runPass(Timestamp now) {
    ReadinessPassResult result;

    for (const auto &graph : graphs_->graphs()) {
        const auto &type = graph->name();

        for (const auto &[state, interval] : graph->retryableStates()) {
            size_t flipped = repository_->bulkMarkReady(type, state, now - interval);
            if (flipped > 0) {
                LOG_DEBUG("ReadinessScheduler: {} '{}' entities in state '{}' ready for retry", flipped, type, state);
            }
            result.markedReady += flipped;
        }

        result.leasesCleared += repository_->clearExpiredLeases(type, now);
        result.readyCounts[type] = repository_->countReady(type);
    }

    completedPasses_++;
    flushStats(result);
    writeLivenessFile();
    return result;
}

void ReadinessScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }
    shutdownRequested_ = false;
    timerThread_ = std::thread(&ReadinessScheduler::timerThreadMain, this);
    LOG_DEBUG("ReadinessScheduler: Timer thread started, interval {}ms", interval_.count());
}

void ReadinessScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(timerMutex_);
        shutdownRequested_ = true;
    }
    timerCondition_.notify_all();
    if (timerThread_.joinable()) {
        timerThread_.join();
    }
    LOG_DEBUG("ReadinessScheduler: Timer thread stopped");
}

void ReadinessScheduler::timerThreadMain() {
    while (!shutdownRequested_) {
        try {
            runPass();
        } catch (const StorageError &e) {
            LOG_WARN("ReadinessScheduler: Pass failed, retrying next interval: {}", e.what());
        } catch (const std::exception &e) {
            LOG_ERROR("ReadinessScheduler: Unexpected error during pass: {}", e.what());
        }
        finishedRounds_++;

        std::unique_lock<std::mutex> lock(timerMutex_);
        timerCondition_.wait_for(lock, interval_, [this] { return shutdownRequested_.load(); });
    }
}

void ReadinessScheduler::flushStats(const ReadinessPassResult &result) {
    std::map<std::string, DispatchStats::Counters> handled;
    if (stats_) {
        handled = stats_->drain();
    }

    if (handled.empty()) {
        LOG_DEBUG("ReadinessScheduler: No tasks handled since last pass");
    }
    for (const auto &[type, counters] : handled) {
        LOG_INFO("ReadinessScheduler: {}: handled {}, transitioned {}, failed {}, lost leases {}", type,
                 counters.handled, counters.transitions, counters.failures, counters.lostLeases);
    }
    for (const auto &[type, ready] : result.readyCounts) {
        LOG_DEBUG("ReadinessScheduler: {}: {} ready", type, ready);
    }
    if (result.leasesCleared > 0) {
        LOG_DEBUG("ReadinessScheduler: Cleared {} expired leases", result.leasesCleared);
    }
}

void ReadinessScheduler::writeLivenessFile() {
    if (livenessFile_.empty()) {
        return;
    }
    std::ofstream file(livenessFile_, std::ios::out | std::ios::trunc);
    if (!file) {
        LOG_WARN("ReadinessScheduler: Cannot write liveness file '{}'", livenessFile_);
        return;
    }
    file << static_cast<long long>(std::time(nullptr));
}

}  // namespace RTE
