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

#include "runtime/EntityManager.h"
#include "common/Logger.h"

#include <stdexcept>

namespace RTE {

EntityManager::EntityManager(std::shared_ptr<IEntityRepository> repository,
                             std::shared_ptr<const GraphRegistry> graphs, std::shared_ptr<IClock> clock)
    : repository_(std::move(repository)), graphs_(std::move(graphs)), clock_(std::move(clock)) {
    if (!repository_ || !graphs_ || !clock_) {
        throw std::invalid_argument("EntityManager requires a repository, graphs and a clock");
    }
}

std::shared_ptr<const StateGraph> EntityManager::graphFor(const std::string &type) const {
    auto graph = graphs_->find(type);
    if (!graph) {
        throw std::invalid_argument("Unknown entity type '" + type + "'");
    }
    return graph;
}

std::optional<EntityRecord> EntityManager::create(const std::string &type, const std::string &id) {
    auto graph = graphFor(type);
    if (id.empty()) {
        throw std::invalid_argument("Entity id cannot be empty");
    }

    auto record = graph->newRecord(id, clock_->now());
    if (!repository_->insert(record)) {
        LOG_DEBUG("EntityManager: {} already exists", record.key.toString());
        return std::nullopt;
    }
    LOG_DEBUG("EntityManager: Created {} in '{}'", record.key.toString(), record.state);
    return record;
}

bool EntityManager::markReady(const EntityKey &key) {
    graphFor(key.type);

    EntityUpdate update;
    update.ready = true;
    return repository_->conditionalUpdate(key, LeaseCondition::any(), update);
}

bool EntityManager::forceState(const EntityKey &key, const std::string &state) {
    auto graph = graphFor(key.type);
    if (!graph->hasState(state)) {
        throw std::invalid_argument("Entity type '" + key.type + "' has no state '" + state + "'");
    }

    auto now = clock_->now();
    bool immediate = graph->attemptsImmediately(state);

    EntityUpdate update;
    update.state = state;
    update.changedAt = now;
    update.ready = immediate;
    update.lastAttemptedAt = immediate ? std::optional<Timestamp>{} : std::optional<Timestamp>{now};

    if (!repository_->conditionalUpdate(key, LeaseCondition::unleased(now), update)) {
        LOG_WARN("EntityManager: Cannot force {} to '{}': missing or leased", key.toString(), state);
        return false;
    }
    LOG_INFO("EntityManager: Forced {} to '{}'", key.toString(), state);
    return true;
}

std::optional<EntityRecord> EntityManager::get(const EntityKey &key) {
    graphFor(key.type);
    return repository_->fetch(key);
}

}  // namespace RTE
