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

#include "model/EntityRecord.h"
#include "types.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief Storage collaborator holding the EntityRecords of all entity types
 *
 * Every operation is a single-row conditional write or a simple bulk update,
 * so it maps onto one statement against a transactional relational store.
 * Implementations must be safe to call from many threads at once and report
 * store failures by throwing StorageError.
 */
class IEntityRepository {
public:
    virtual ~IEntityRepository() = default;

    /**
     * @brief Read the current record of one entity
     * @return Record, or nullopt if the entity does not exist
     */
    virtual std::optional<EntityRecord> fetch(const EntityKey &key) = 0;

    /**
     * @brief Insert a new record
     * @return false if an entity with the same key already exists
     */
    virtual bool insert(const EntityRecord &record) = 0;

    /**
     * @brief Ready entities of one type whose state is in `states`
     *
     * @param type Entity type
     * @param limit Maximum number of records returned
     * @param excludeLeased Skip entities whose lease is still held at `now`
     * @param now Reference time for the lease check
     * @param states Dispatchable states; records in other states are never returned
     * @return Records ordered by the time they entered their state, oldest first
     */
    virtual std::vector<EntityRecord> fetchReadyBatch(const std::string &type, size_t limit, bool excludeLeased,
                                                      Timestamp now, const std::vector<std::string> &states) = 0;

    /**
     * @brief Apply `update` to one entity only if `expected` holds for its lease column
     *
     * The check and the write happen atomically (compare-and-swap).
     * @return true if the row matched and was updated
     */
    virtual bool conditionalUpdate(const EntityKey &key, const LeaseCondition &expected,
                                   const EntityUpdate &update) = 0;

    /**
     * @brief Set ready = true on non-ready entities of (type, state) that were
     *        never attempted in that state or last attempted at or before `cutoff`
     * @return Number of entities flipped
     */
    virtual size_t bulkMarkReady(const std::string &type, const std::string &state, Timestamp cutoff) = 0;

    /**
     * @brief Null out leases of one type that expired before `now`
     * @return Number of leases cleared
     */
    virtual size_t clearExpiredLeases(const std::string &type, Timestamp now) = 0;

    /**
     * @brief Number of entities of one type currently flagged ready
     */
    virtual size_t countReady(const std::string &type) = 0;
};

}  // namespace RTE
