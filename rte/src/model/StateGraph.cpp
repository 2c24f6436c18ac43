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

#include "model/StateGraph.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>

namespace RTE {

StateGraph::Builder::Builder(std::string name) : name_(std::move(name)) {}

StateGraph::Builder &StateGraph::Builder::state(const std::string &name, StateOptions options) {
    if (states_.count(name) > 0) {
        duplicates_.push_back(name);
        return *this;
    }
    StateDefinition definition;
    definition.name = name;
    definition.options = std::move(options);
    states_.emplace(name, std::move(definition));
    order_.push_back(name);
    return *this;
}

StateGraph::Builder &StateGraph::Builder::transition(const std::string &from, const std::string &to) {
    transitions_.emplace_back(from, to);
    return *this;
}

StateGraph::Builder &StateGraph::Builder::timeout(const std::string &from, const std::string &to, Duration after) {
    timeouts_.emplace_back(from, to, after);
    return *this;
}

StateGraph::Builder &StateGraph::Builder::handler(const std::string &state, std::shared_ptr<IStateHandler> handler) {
    handlers_.emplace_back(state, std::move(handler));
    return *this;
}

StateGraph::Builder &StateGraph::Builder::initialState(const std::string &name) {
    initialState_ = name;
    return *this;
}

std::shared_ptr<const StateGraph> StateGraph::Builder::build() {
    if (name_.empty()) {
        throw GraphDefinitionError(name_, "graph name cannot be empty");
    }
    if (states_.empty()) {
        throw GraphDefinitionError(name_, "graph declares no states");
    }
    if (!duplicates_.empty()) {
        throw GraphDefinitionError(name_, "state '" + duplicates_.front() + "' declared more than once");
    }
    if (states_.count("") > 0) {
        throw GraphDefinitionError(name_, "state names cannot be empty");
    }

    auto states = states_;
    std::set<std::string> hasParents;

    auto requireState = [&](const std::string &state, const std::string &usage) {
        if (states.count(state) == 0) {
            throw GraphDefinitionError(name_, usage + " references undeclared state '" + state + "'");
        }
    };

    for (const auto &[from, to] : transitions_) {
        requireState(from, "transition " + from + " -> " + to);
        requireState(to, "transition " + from + " -> " + to);
        states[from].targets.insert(to);
        if (from != to) {
            hasParents.insert(to);
        }
    }

    for (const auto &[from, to, after] : timeouts_) {
        requireState(from, "timeout " + from + " -> " + to);
        requireState(to, "timeout " + from + " -> " + to);
        auto &definition = states[from];
        if (definition.timeoutState) {
            throw GraphDefinitionError(name_, "state '" + from + "' already has a timeout");
        }
        if (after <= Duration::zero()) {
            throw GraphDefinitionError(name_, "timeout of state '" + from + "' must be positive");
        }
        definition.timeoutState = to;
        definition.timeoutAfter = after;
        definition.targets.insert(to);
        if (from != to) {
            hasParents.insert(to);
        }
    }

    for (auto &[state, handler] : handlers_) {
        requireState(state, "handler");
        if (!handler) {
            throw GraphDefinitionError(name_, "handler for state '" + state + "' is null");
        }
        auto &options = states[state].options;
        if (options.handler && options.handler != handler) {
            throw GraphDefinitionError(name_, "state '" + state + "' has more than one handler");
        }
        options.handler = handler;
    }

    std::shared_ptr<StateGraph> graph(new StateGraph());
    graph->name_ = name_;
    graph->order_ = order_;

    for (const auto &name : order_) {
        auto &definition = states[name];
        const auto &options = definition.options;
        definition.terminal = definition.targets.empty();

        if (options.tryInterval && *options.tryInterval <= Duration::zero()) {
            throw GraphDefinitionError(name_, "try interval of state '" + name + "' must be positive");
        }

        if (definition.terminal) {
            if (options.handler) {
                throw GraphDefinitionError(name_, "terminal state '" + name + "' should not have a handler");
            }
            graph->terminalStates_.push_back(name);
            continue;
        }

        if (options.externallyProgressed) {
            if (options.handler) {
                throw GraphDefinitionError(name_, "externally progressed state '" + name +
                                                      "' should not have a handler");
            }
            if (definition.timeoutState) {
                throw GraphDefinitionError(name_, "externally progressed state '" + name +
                                                      "' cannot time out");
            }
            continue;
        }

        if (!options.handler) {
            throw GraphDefinitionError(name_, "state '" + name + "' does not have a handler");
        }
        if (!options.tryInterval && !options.manualOnly) {
            throw GraphDefinitionError(name_, "state '" + name +
                                                  "' has no try interval and is not terminal, external or manual");
        }

        graph->automaticStates_.push_back(name);
        if (options.tryInterval && !options.manualOnly) {
            graph->retryableStates_.emplace_back(name, *options.tryInterval);
        }
    }

    if (initialState_) {
        requireState(*initialState_, "initial state");
        graph->initialState_ = *initialState_;
    } else {
        std::vector<std::string> candidates;
        for (const auto &name : order_) {
            if (states[name].options.forceInitial || hasParents.count(name) == 0) {
                candidates.push_back(name);
            }
        }
        if (candidates.empty()) {
            throw GraphDefinitionError(name_, "graph has no initial state");
        }
        if (candidates.size() > 1) {
            throw GraphDefinitionError(name_, "graph has more than one initial state: " + candidates[0] + " and " +
                                                  candidates[1]);
        }
        graph->initialState_ = candidates.front();
    }

    graph->states_ = std::move(states);

    LOG_DEBUG("StateGraph: Built '{}' with {} states ({} automatic, {} terminal), initial '{}'", graph->name_,
              graph->order_.size(), graph->automaticStates_.size(), graph->terminalStates_.size(),
              graph->initialState_);
    return graph;
}

bool StateGraph::hasState(const std::string &state) const {
    return states_.count(state) > 0;
}

const StateDefinition *StateGraph::definition(const std::string &state) const {
    auto it = states_.find(state);
    return it != states_.end() ? &it->second : nullptr;
}

IStateHandler *StateGraph::handlerFor(const std::string &state) const {
    const auto *def = definition(state);
    if (!def || !def->isAutomatic()) {
        return nullptr;
    }
    return def->options.handler.get();
}

std::optional<Duration> StateGraph::tryInterval(const std::string &state) const {
    const auto *def = definition(state);
    return def ? def->options.tryInterval : std::nullopt;
}

bool StateGraph::isTerminalOrExternal(const std::string &state) const {
    const auto *def = definition(state);
    return !def || !def->isAutomatic();
}

bool StateGraph::isTerminal(const std::string &state) const {
    const auto *def = definition(state);
    return def && def->terminal;
}

bool StateGraph::validTransition(const std::string &from, const std::string &to) const {
    const auto *def = definition(from);
    return def && def->targets.count(to) > 0;
}

bool StateGraph::attemptsImmediately(const std::string &state) const {
    const auto *def = definition(state);
    return !def || def->options.attemptImmediately || !def->options.tryInterval;
}

std::optional<std::pair<std::string, Duration>> StateGraph::timeoutFor(const std::string &state) const {
    const auto *def = definition(state);
    if (!def || !def->timeoutState || !def->timeoutAfter) {
        return std::nullopt;
    }
    return std::make_pair(*def->timeoutState, *def->timeoutAfter);
}

EntityRecord StateGraph::newRecord(const std::string &id, Timestamp now) const {
    EntityRecord record;
    record.key = EntityKey{name_, id};
    record.state = initialState_;
    record.changedAt = now;
    record.ready = attemptsImmediately(initialState_);
    if (!record.ready) {
        // First attempt waits one try interval
        record.lastAttemptedAt = now;
    }
    return record;
}

}  // namespace RTE
