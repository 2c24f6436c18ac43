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
#include "model/IStateHandler.h"
#include "types.h"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace RTE {

/**
 * @brief Declaration-time options of a single state
 */
struct StateOptions {
    std::optional<Duration> tryInterval;  // Absent: never re-armed by the readiness pass
    bool externallyProgressed = false;    // No handler runs; other code moves the entity
    bool manualOnly = false;              // Handler runs only after an explicit external trigger
    bool attemptImmediately = true;       // Ready on entry, or wait one try interval first
    bool forceInitial = false;            // Initial even though it has incoming transitions
    std::shared_ptr<IStateHandler> handler;
};

/**
 * @brief A declared state with its resolved graph properties
 */
struct StateDefinition {
    std::string name;
    StateOptions options;
    std::set<std::string> targets;  // Declared transitions, timeout target included
    std::optional<std::string> timeoutState;
    std::optional<Duration> timeoutAfter;
    bool terminal = false;

    /**
     * @brief Whether the worker loop ever dispatches a handler for this state
     */
    bool isAutomatic() const {
        return !terminal && !options.externallyProgressed;
    }
};

/**
 * @brief Immutable finite state machine of one entity type
 *
 * Built once at process start through StateGraph::Builder, validated eagerly,
 * then shared read-only between the scheduler, the worker loop and all pool
 * threads. Lookups of unknown state names never throw: they answer as for a
 * state that must not be dispatched.
 *
 * @code
 * auto graph = RTE::StateGraph::Builder("delivery")
 *                  .state("new", {.tryInterval = 30s, .handler = sendHandler})
 *                  .state("sent")
 *                  .transition("new", "sent")
 *                  .build();
 * @endcode
 */
class StateGraph {
public:
    class Builder {
    public:
        explicit Builder(std::string name);

        Builder &state(const std::string &name, StateOptions options = {});
        Builder &transition(const std::string &from, const std::string &to);

        /**
         * @brief Leave `from` for `to` once the entity has been in `from` for `after`
         */
        Builder &timeout(const std::string &from, const std::string &to, Duration after);

        Builder &handler(const std::string &state, std::shared_ptr<IStateHandler> handler);
        Builder &initialState(const std::string &name);

        /**
         * @brief Validate and freeze the graph
         * @throws GraphDefinitionError on any structural defect
         */
        std::shared_ptr<const StateGraph> build();

    private:
        std::string name_;
        std::vector<std::string> order_;
        std::map<std::string, StateDefinition> states_;
        std::vector<std::pair<std::string, std::string>> transitions_;
        std::vector<std::tuple<std::string, std::string, Duration>> timeouts_;
        std::vector<std::pair<std::string, std::shared_ptr<IStateHandler>>> handlers_;
        std::optional<std::string> initialState_;
        std::vector<std::string> duplicates_;
    };

    const std::string &name() const {
        return name_;
    }

    const std::string &initialState() const {
        return initialState_;
    }

    bool hasState(const std::string &state) const;
    const StateDefinition *definition(const std::string &state) const;

    IStateHandler *handlerFor(const std::string &state) const;
    std::optional<Duration> tryInterval(const std::string &state) const;
    bool isTerminalOrExternal(const std::string &state) const;
    bool isTerminal(const std::string &state) const;
    bool validTransition(const std::string &from, const std::string &to) const;
    bool attemptsImmediately(const std::string &state) const;

    /**
     * @brief Timeout of a state as (target, duration), if declared
     */
    std::optional<std::pair<std::string, Duration>> timeoutFor(const std::string &state) const;

    /**
     * @brief States the worker loop dispatches handlers for, in declaration order
     */
    const std::vector<std::string> &automaticStates() const {
        return automaticStates_;
    }

    /**
     * @brief Automatic states re-armed by the readiness pass, with their intervals
     */
    const std::vector<std::pair<std::string, Duration>> &retryableStates() const {
        return retryableStates_;
    }

    const std::vector<std::string> &terminalStates() const {
        return terminalStates_;
    }

    const std::vector<std::string> &stateNames() const {
        return order_;
    }

    /**
     * @brief Scheduling metadata for a newly created entity of this type
     */
    EntityRecord newRecord(const std::string &id, Timestamp now) const;

private:
    StateGraph() = default;

    std::string name_;
    std::string initialState_;
    std::vector<std::string> order_;
    std::map<std::string, StateDefinition> states_;
    std::vector<std::string> automaticStates_;
    std::vector<std::pair<std::string, Duration>> retryableStates_;
    std::vector<std::string> terminalStates_;
};

}  // namespace RTE
