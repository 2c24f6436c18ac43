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

#include "lease/LeaseManager.h"
#include "common/Logger.h"

#include <stdexcept>

namespace RTE {

LeaseManager::LeaseManager(std::shared_ptr<IEntityRepository> repository, std::shared_ptr<IClock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
    if (!repository_) {
        throw std::invalid_argument("LeaseManager requires a repository");
    }
    if (!clock_) {
        throw std::invalid_argument("LeaseManager requires a clock");
    }
}

std::optional<Lease> LeaseManager::tryAcquire(const EntityKey &key, Duration duration) {
    if (duration <= Duration::zero()) {
        throw std::invalid_argument("LeaseManager: lease duration must be positive");
    }

    auto now = clock_->now();
    Lease lease{key, now + duration};

    EntityUpdate update;
    update.leaseExpiresAt = std::optional<Timestamp>(lease.expiresAt);

    if (!repository_->conditionalUpdate(key, LeaseCondition::unleased(now), update)) {
        LOG_TRACE("LeaseManager: {} is leased elsewhere", key.toString());
        return std::nullopt;
    }

    LOG_TRACE("LeaseManager: Acquired {} for {}ms", key.toString(), duration.count());
    return lease;
}

std::optional<Lease> LeaseManager::tryClaim(const EntityRecord &fetched, Duration duration) {
    if (duration <= Duration::zero()) {
        throw std::invalid_argument("LeaseManager: lease duration must be positive");
    }

    auto now = clock_->now();
    Lease lease{fetched.key, now + duration};

    EntityUpdate update;
    update.leaseExpiresAt = std::optional<Timestamp>(lease.expiresAt);
    update.ready = false;
    update.lastAttemptedAt = std::optional<Timestamp>(now);

    if (!repository_->conditionalUpdate(fetched.key, LeaseCondition::claimable(now, fetched.state), update)) {
        LOG_TRACE("LeaseManager: {} is leased elsewhere or no longer ready in '{}'", fetched.key.toString(),
                  fetched.state);
        return std::nullopt;
    }

    LOG_TRACE("LeaseManager: Claimed {} in '{}' for {}ms", fetched.key.toString(), fetched.state, duration.count());
    return lease;
}

bool LeaseManager::release(const Lease &lease) {
    EntityUpdate update;
    update.leaseExpiresAt = std::optional<Timestamp>();

    bool released = repository_->conditionalUpdate(lease.key, LeaseCondition::heldUntil(lease.expiresAt), update);
    if (!released) {
        LOG_WARN("LeaseManager: Lease on {} was lost before release", lease.key.toString());
    }
    return released;
}

bool LeaseManager::extend(Lease &lease, Duration duration) {
    if (duration <= Duration::zero()) {
        throw std::invalid_argument("LeaseManager: lease duration must be positive");
    }

    auto expiresAt = clock_->now() + duration;
    EntityUpdate update;
    update.leaseExpiresAt = std::optional<Timestamp>(expiresAt);

    if (!repository_->conditionalUpdate(lease.key, LeaseCondition::heldUntil(lease.expiresAt), update)) {
        LOG_WARN("LeaseManager: Cannot extend lost lease on {}", lease.key.toString());
        return false;
    }
    lease.expiresAt = expiresAt;
    return true;
}

bool LeaseManager::isHeld(const EntityKey &key) {
    auto record = repository_->fetch(key);
    return record && record->isLeased(clock_->now());
}

}  // namespace RTE
