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
#include <optional>
#include <string>

namespace RTE {

/**
 * @brief Scheduling metadata persisted with every managed entity
 *
 * A lease is held while leaseExpiresAt is present and not before now; an
 * expired or absent lease is free.
 */
struct EntityRecord {
    EntityKey key;
    std::string state;
    bool ready = true;
    Timestamp changedAt{};
    std::optional<Timestamp> lastAttemptedAt;
    std::optional<Timestamp> leaseExpiresAt;

    bool isLeased(Timestamp now) const {
        return leaseExpiresAt.has_value() && *leaseExpiresAt >= now;
    }

    bool operator==(const EntityRecord &other) const = default;
};

/**
 * @brief Partial update applied by IEntityRepository::conditionalUpdate
 *
 * Absent members are left untouched. For the nullable columns the outer
 * optional selects the column, the inner one carries the value (nullopt
 * writes NULL).
 */
struct EntityUpdate {
    std::optional<std::string> state;
    std::optional<bool> ready;
    std::optional<Timestamp> changedAt;
    std::optional<std::optional<Timestamp>> lastAttemptedAt;
    std::optional<std::optional<Timestamp>> leaseExpiresAt;

    bool empty() const {
        return !state && !ready && !changedAt && !lastAttemptedAt && !leaseExpiresAt;
    }

    void applyTo(EntityRecord &record) const {
        if (state) {
            record.state = *state;
        }
        if (ready) {
            record.ready = *ready;
        }
        if (changedAt) {
            record.changedAt = *changedAt;
        }
        if (lastAttemptedAt) {
            record.lastAttemptedAt = *lastAttemptedAt;
        }
        if (leaseExpiresAt) {
            record.leaseExpiresAt = *leaseExpiresAt;
        }
    }
};

/**
 * @brief Precondition for a conditional update
 *
 * Kind constrains the lease column. readyInState additionally requires the
 * entity to be flagged ready and still in that state, which turns a stale
 * row from a ready batch into a refused claim.
 */
struct LeaseCondition {
    enum class Kind {
        ANY,        // No precondition
        UNLEASED,   // Lease absent or expired at `now`
        HELD_UNTIL  // Lease present with exactly `expiresAt`
    };

    Kind kind = Kind::ANY;
    Timestamp now{};
    Timestamp expiresAt{};
    std::optional<std::string> readyInState;

    static LeaseCondition any() {
        return LeaseCondition{};
    }

    static LeaseCondition unleased(Timestamp now) {
        return LeaseCondition{Kind::UNLEASED, now, Timestamp{}, std::nullopt};
    }

    /**
     * @brief Lease free at `now`, ready flag set and state unchanged
     */
    static LeaseCondition claimable(Timestamp now, std::string state) {
        return LeaseCondition{Kind::UNLEASED, now, Timestamp{}, std::move(state)};
    }

    static LeaseCondition heldUntil(Timestamp expiresAt) {
        return LeaseCondition{Kind::HELD_UNTIL, Timestamp{}, expiresAt, std::nullopt};
    }

    bool matches(const EntityRecord &record) const {
        if (readyInState && (!record.ready || record.state != *readyInState)) {
            return false;
        }
        switch (kind) {
        case Kind::ANY:
            return true;
        case Kind::UNLEASED:
            return !record.isLeased(now);
        case Kind::HELD_UNTIL:
            return record.leaseExpiresAt.has_value() && *record.leaseExpiresAt == expiresAt;
        }
        return false;
    }
};

}  // namespace RTE
