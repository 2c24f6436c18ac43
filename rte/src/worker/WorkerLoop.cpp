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

#include "worker/WorkerLoop.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace RTE {

namespace {

// Shutdown requests are polled at this granularity while sleeping or draining
constexpr Duration POLL_SLICE{100};

constexpr double BACKOFF_FACTOR = 1.5;

}  // namespace

WorkerLoop::WorkerLoop(std::shared_ptr<IEntityRepository> repository, std::shared_ptr<const GraphRegistry> graphs,
                       std::shared_ptr<IClock> clock, EngineConfig config)
    : repository_(std::move(repository)), graphs_(std::move(graphs)), clock_(std::move(clock)),
      config_(std::move(config)), leases_(repository_, clock_), stats_(std::make_shared<DispatchStats>()) {
    if (!graphs_) {
        throw std::invalid_argument("WorkerLoop requires a graph registry");
    }
    config_.validate();

    scheduler_ = std::make_unique<ReadinessScheduler>(repository_, graphs_, clock_, config_.scheduleInterval);
    scheduler_->setStats(stats_);
    if (!config_.livenessFile.empty()) {
        scheduler_->setLivenessFile(config_.livenessFile);
    }
    pool_ = std::make_unique<WorkerPool>(config_.concurrency);
}

WorkerLoop::~WorkerLoop() {
    scheduler_->stop();
    pool_->shutdown(state_ != WorkerState::STOPPED);
}

RunStats WorkerLoop::run() {
    if (state_ == WorkerState::STOPPED) {
        throw std::logic_error("WorkerLoop::run: loop already stopped");
    }

    takeRunStats(RunOutcome::CLEAN);
    const auto startedAt = std::chrono::steady_clock::now();
    Duration delay = config_.minLoopDelay;

    LOG_INFO("WorkerLoop: Running {} entity types, concurrency {} ({} per type)", graphs_->graphs().size(),
             config_.concurrency, config_.concurrencyPerType);
    size_t seenRounds = scheduler_->finishedRounds();
    auto lastRoundAt = startedAt;
    bool stalled = false;
    scheduler_->start();

    while (shutdownRequests_.load() == 0) {
        const auto now = std::chrono::steady_clock::now();
        if (config_.runFor > Duration::zero() && now - startedAt >= config_.runFor) {
            LOG_INFO("WorkerLoop: Run time of {}ms reached", config_.runFor.count());
            break;
        }

        size_t rounds = scheduler_->finishedRounds();
        if (rounds != seenRounds) {
            seenRounds = rounds;
            lastRoundAt = now;
        } else if (config_.watchdog && now - lastRoundAt > config_.scheduleInterval * 2) {
            LOG_ERROR("WorkerLoop: No readiness round finished in {}ms, likely deadlocked",
                      std::chrono::duration_cast<Duration>(now - lastRoundAt).count());
            stalled = true;
            break;
        }

        size_t dispatched = 0;
        try {
            dispatched = dispatchPass();
        } catch (const StorageError &e) {
            LOG_WARN("WorkerLoop: Store unavailable, retrying in {}ms: {}", delay.count(), e.what());
        }

        if (dispatched > 0) {
            delay = config_.minLoopDelay;
            continue;
        }
        sleepFor(delay);
        if (inFlight() > 0) {
            // Slots freed by running handlers are refilled promptly
            delay = config_.minLoopDelay;
        } else {
            auto next = std::chrono::duration_cast<Duration>(delay * BACKOFF_FACTOR);
            delay = std::min(next, config_.maxLoopDelay);
        }
    }

    RunOutcome outcome;
    if (stalled) {
        outcome = abandon();
    } else {
        scheduler_->stop();
        outcome = drain();
    }

    auto result = takeRunStats(outcome);
    LOG_INFO("WorkerLoop: Stopped ({}): {} handled, {} transitions, {} failures, {} lost leases", toString(outcome),
             result.totalHandled(), result.transitions, result.failures, result.lostLeases);
    return result;
}

RunStats WorkerLoop::runOnce() {
    if (state_ == WorkerState::STOPPED) {
        throw std::logic_error("WorkerLoop::runOnce: loop already stopped");
    }

    takeRunStats(RunOutcome::CLEAN);
    scheduler_->runPass();
    size_t dispatched = dispatchPass();
    LOG_DEBUG("WorkerLoop: Manual pass dispatched {} entities", dispatched);

    RunOutcome outcome = RunOutcome::CLEAN;
    if (!waitForIdle()) {
        outcome = RunOutcome::FORCED;
        state_ = WorkerState::STOPPED;
        pool_->close(true);
    }
    return takeRunStats(outcome);
}

RunOutcome WorkerLoop::drain() {
    if (!forceRequested()) {
        state_ = WorkerState::DRAINING;
        LOG_INFO("WorkerLoop: Draining {} in-flight handlers (grace {}ms)", inFlight(),
                 config_.shutdownGrace.count());
    }

    const auto deadline = std::chrono::steady_clock::now() + config_.shutdownGrace;
    RunOutcome outcome = RunOutcome::CLEAN;

    while (true) {
        if (forceRequested()) {
            LOG_WARN("WorkerLoop: Forced stop, {} handlers abandoned; their leases will expire", inFlight());
            outcome = RunOutcome::FORCED;
            break;
        }

        std::unique_lock<std::mutex> lock(inFlightMutex_);
        if (inFlightTotal_ == 0) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_WARN("WorkerLoop: Grace period elapsed with {} handlers still running", inFlightTotal_);
            outcome = RunOutcome::DRAIN_TIMED_OUT;
            break;
        }
        idleCondition_.wait_for(lock, POLL_SLICE);
    }

    state_ = WorkerState::STOPPED;
    pool_->close(outcome != RunOutcome::CLEAN);
    return outcome;
}

RunOutcome WorkerLoop::abandon() {
    // The readiness thread is stuck in the store and cannot be joined here
    LOG_WARN("WorkerLoop: Abandoning {} in-flight handlers; their leases will expire", inFlight());
    state_ = WorkerState::STOPPED;
    pool_->close(true);
    return RunOutcome::SCHEDULER_STALLED;
}

bool WorkerLoop::waitForIdle() {
    std::unique_lock<std::mutex> lock(inFlightMutex_);
    while (inFlightTotal_ > 0) {
        if (forceRequested()) {
            return false;
        }
        idleCondition_.wait_for(lock, POLL_SLICE);
    }
    return true;
}

void WorkerLoop::sleepFor(Duration delay) {
    const auto until = std::chrono::steady_clock::now() + delay;
    while (shutdownRequests_.load() == 0) {
        auto now = std::chrono::steady_clock::now();
        if (now >= until) {
            return;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(until - now, POLL_SLICE));
    }
}

size_t WorkerLoop::dispatchPass() {
    const auto &graphs = graphs_->graphs();
    if (graphs.empty()) {
        return 0;
    }

    size_t dispatched = 0;
    const size_t count = graphs.size();
    const size_t first = rotation_++ % count;

    for (size_t i = 0; i < count; ++i) {
        const auto &graph = graphs[(first + i) % count];
        if (graph->automaticStates().empty()) {
            continue;
        }

        size_t limit = freeSlots(graph->name());
        if (limit == 0) {
            continue;
        }

        auto batch = repository_->fetchReadyBatch(graph->name(), limit, true, clock_->now(), graph->automaticStates());
        for (const auto &record : batch) {
            if (shutdownRequests_.load() > 0) {
                return dispatched;
            }
            if (dispatch(graph, record)) {
                dispatched++;
            }
        }
    }
    return dispatched;
}

bool WorkerLoop::dispatch(const std::shared_ptr<const StateGraph> &graph, const EntityRecord &record) {
    auto lease = leases_.tryClaim(record, config_.leaseDuration);
    if (!lease) {
        LOG_DEBUG("WorkerLoop: {} leased or handled elsewhere, skipping", record.key.toString());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        inFlightByType_[record.key.type]++;
        inFlightTotal_++;
    }

    bool submitted = pool_->submit([this, graph, held = *lease]() {
        invoke(graph, held);
        finishInvocation(graph->name());
    });
    if (!submitted) {
        finishInvocation(record.key.type);
        if (!leases_.release(*lease)) {
            recordLostLease(record.key.type);
        }
        return false;
    }
    return true;
}

void WorkerLoop::invoke(const std::shared_ptr<const StateGraph> &graph, Lease lease) {
    const auto &key = lease.key;
    recordHandled(key.type);

    std::optional<EntityRecord> entity;
    try {
        entity = repository_->fetch(key);
    } catch (const StorageError &e) {
        LOG_ERROR("WorkerLoop: Cannot re-read {}: {}", key.toString(), e.what());
        recordFailure(key.type);
        return;
    }

    if (!entity) {
        LOG_WARN("WorkerLoop: {} disappeared before its handler ran", key.toString());
        return;
    }
    if (entity->leaseExpiresAt != lease.expiresAt) {
        LOG_WARN("WorkerLoop: Lease on {} lost before its handler ran", key.toString());
        recordLostLease(key.type);
        return;
    }

    const std::string from = entity->state;
    TransitionResult target;
    bool failed = false;

    auto timeout = graph->timeoutFor(from);
    if (timeout && entity->changedAt + timeout->second <= clock_->now()) {
        LOG_INFO("WorkerLoop: {} timed out in '{}' after {}ms", key.toString(), from, timeout->second.count());
        target = timeout->first;
    } else if (IStateHandler *handler = graph->handlerFor(from)) {
        HandlerContext context(*entity, [this, &lease](Duration duration) { return leases_.extend(lease, duration); });
        try {
            target = handler->handle(context);
        } catch (const std::exception &e) {
            LOG_ERROR("WorkerLoop: Handler for {} in '{}' failed: {}", key.toString(), from, e.what());
            failed = true;
        } catch (...) {
            LOG_ERROR("WorkerLoop: Handler for {} in '{}' threw a non-standard exception", key.toString(), from);
            failed = true;
        }
    } else {
        LOG_WARN("WorkerLoop: {} is in '{}', which has no handler", key.toString(), from);
    }

    if (target && !graph->validTransition(from, *target)) {
        LOG_ERROR("WorkerLoop: Handler for {} returned '{}', not a transition of '{}'", key.toString(), *target, from);
        target.reset();
        failed = true;
    }

    EntityUpdate update;
    update.leaseExpiresAt = std::optional<Timestamp>{};
    if (target) {
        auto now = clock_->now();
        bool immediate = graph->attemptsImmediately(*target);
        update.state = *target;
        update.changedAt = now;
        update.ready = immediate;
        update.lastAttemptedAt = immediate ? std::optional<Timestamp>{} : std::optional<Timestamp>{now};
    }

    bool applied = false;
    try {
        applied = repository_->conditionalUpdate(key, LeaseCondition::heldUntil(lease.expiresAt), update);
    } catch (const StorageError &e) {
        LOG_ERROR("WorkerLoop: Cannot store outcome of {}: {}", key.toString(), e.what());
        recordFailure(key.type);
        return;
    }

    if (!applied) {
        LOG_WARN("WorkerLoop: Lease on {} lost while handling '{}', result discarded", key.toString(), from);
        recordLostLease(key.type);
        return;
    }

    if (failed) {
        recordFailure(key.type);
    } else if (target) {
        LOG_DEBUG("WorkerLoop: {} moved '{}' -> '{}'", key.toString(), from, *target);
        recordTransition(key.type);
    }
}

void WorkerLoop::finishInvocation(const std::string &type) {
    std::lock_guard<std::mutex> lock(inFlightMutex_);
    auto it = inFlightByType_.find(type);
    if (it != inFlightByType_.end() && it->second > 0) {
        it->second--;
    }
    if (inFlightTotal_ > 0) {
        inFlightTotal_--;
    }
    idleCondition_.notify_all();
}

size_t WorkerLoop::freeSlots(const std::string &type) const {
    std::lock_guard<std::mutex> lock(inFlightMutex_);
    if (inFlightTotal_ >= config_.concurrency) {
        return 0;
    }
    size_t global = config_.concurrency - inFlightTotal_;

    auto it = inFlightByType_.find(type);
    size_t typeInFlight = it == inFlightByType_.end() ? 0 : it->second;
    if (typeInFlight >= config_.concurrencyPerType) {
        return 0;
    }
    return std::min(global, config_.concurrencyPerType - typeInFlight);
}

size_t WorkerLoop::inFlight() const {
    std::lock_guard<std::mutex> lock(inFlightMutex_);
    return inFlightTotal_;
}

void WorkerLoop::recordHandled(const std::string &type) {
    stats_->recordHandled(type);
    std::lock_guard<std::mutex> lock(runStatsMutex_);
    runStats_.handled[type]++;
}

void WorkerLoop::recordTransition(const std::string &type) {
    stats_->recordTransition(type);
    std::lock_guard<std::mutex> lock(runStatsMutex_);
    runStats_.transitions++;
}

void WorkerLoop::recordFailure(const std::string &type) {
    stats_->recordFailure(type);
    std::lock_guard<std::mutex> lock(runStatsMutex_);
    runStats_.failures++;
}

void WorkerLoop::recordLostLease(const std::string &type) {
    stats_->recordLostLease(type);
    std::lock_guard<std::mutex> lock(runStatsMutex_);
    runStats_.lostLeases++;
}

RunStats WorkerLoop::takeRunStats(RunOutcome outcome) {
    std::lock_guard<std::mutex> lock(runStatsMutex_);
    RunStats result = std::move(runStats_);
    runStats_ = RunStats{};
    result.outcome = outcome;
    return result;
}

}  // namespace RTE
