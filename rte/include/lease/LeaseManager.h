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
#include "storage/IEntityRepository.h"
#include "types.h"

#include <memory>
#include <optional>

namespace RTE {

/**
 * @brief A time-bounded exclusive claim on one entity
 *
 * expiresAt doubles as the ownership token: release and extend only succeed
 * while the stored lease still carries exactly this expiry.
 */
struct Lease {
    EntityKey key;
    Timestamp expiresAt{};
};

/**
 * @brief Per-entity mutual exclusion without a lock server
 *
 * Every operation is one conditional update against the repository. A holder
 * that crashes never releases; its lease simply expires and the entity is
 * picked up by the next scan. There is no heartbeat.
 */
class LeaseManager {
public:
    LeaseManager(std::shared_ptr<IEntityRepository> repository, std::shared_ptr<IClock> clock);

    /**
     * @brief Claim the entity until now + duration
     *
     * Succeeds only if the entity has no lease or its lease expired strictly
     * before now.
     * @return The lease, or nullopt if another holder owns it (or the entity is gone)
     */
    std::optional<Lease> tryAcquire(const EntityKey &key, Duration duration);

    /**
     * @brief Lease an entity taken from a ready batch and mark it attempted
     *
     * One conditional update sets the lease, clears the ready flag and stamps
     * last_attempted_at. It is refused unless the entity is still ready, still
     * in the fetched state and not leased, so a row that another worker
     * handled after the batch was read is skipped.
     */
    std::optional<Lease> tryClaim(const EntityRecord &fetched, Duration duration);

    /**
     * @brief Drop the lease if it is still ours
     * @return false if the lease had already been lost
     */
    bool release(const Lease &lease);

    /**
     * @brief Move the expiry of a held lease to now + duration
     *
     * On success `lease.expiresAt` is updated to the new token.
     * @return false if the lease had already been lost
     */
    bool extend(Lease &lease, Duration duration);

    /**
     * @brief Whether any holder currently owns the entity
     */
    bool isHeld(const EntityKey &key);

private:
    std::shared_ptr<IEntityRepository> repository_;
    std::shared_ptr<IClock> clock_;
};

}  // namespace RTE
