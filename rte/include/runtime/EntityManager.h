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
#include "runtime/GraphRegistry.h"
#include "storage/IEntityRepository.h"

#include <memory>
#include <optional>
#include <string>

namespace RTE {

/**
 * @brief Entry points for code outside the worker loop
 *
 * Creates entities in their graph's initial state and provides the explicit
 * triggers for states the readiness pass never re-arms. Unknown entity types
 * and undeclared states are rejected with std::invalid_argument.
 */
class EntityManager {
public:
    EntityManager(std::shared_ptr<IEntityRepository> repository, std::shared_ptr<const GraphRegistry> graphs,
                  std::shared_ptr<IClock> clock);

    /**
     * @brief Insert a new entity in the initial state of its type
     * @return The stored record, or nullopt if the entity already exists
     */
    std::optional<EntityRecord> create(const std::string &type, const std::string &id);

    /**
     * @brief Make the entity dispatchable on the next loop iteration
     * @return false if the entity does not exist
     */
    bool markReady(const EntityKey &key);

    /**
     * @brief Move an entity to any declared state, bypassing transitions
     *
     * Refused while a worker holds the entity's lease.
     * @return false if the entity does not exist or is leased
     */
    bool forceState(const EntityKey &key, const std::string &state);

    std::optional<EntityRecord> get(const EntityKey &key);

private:
    std::shared_ptr<const StateGraph> graphFor(const std::string &type) const;

    std::shared_ptr<IEntityRepository> repository_;
    std::shared_ptr<const GraphRegistry> graphs_;
    std::shared_ptr<IClock> clock_;
};

}  // namespace RTE
