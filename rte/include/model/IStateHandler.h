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
#include <functional>
#include <optional>
#include <string>

namespace RTE {

/**
 * @brief Outcome of a handler: the name of the next state, or nullopt to stay
 */
using TransitionResult = std::optional<std::string>;

/**
 * @brief Per-invocation view handed to a state handler
 *
 * Carries the entity as re-fetched from the store right before the call, and
 * lets long-running handlers push their lease expiry forward.
 */
class HandlerContext {
public:
    using LeaseExtender = std::function<bool(Duration)>;

    HandlerContext(EntityRecord entity, LeaseExtender extender)
        : entity_(std::move(entity)), extender_(std::move(extender)) {}

    const EntityRecord &entity() const {
        return entity_;
    }

    const EntityKey &key() const {
        return entity_.key;
    }

    const std::string &state() const {
        return entity_.state;
    }

    /**
     * @brief Refresh the lease to now + duration
     * @return false if the lease was already lost; the handler should wrap up
     */
    bool extendLease(Duration duration) {
        return extender_ ? extender_(duration) : false;
    }

private:
    EntityRecord entity_;
    LeaseExtender extender_;
};

/**
 * @brief Business logic for one state of one entity type
 *
 * Invoked at least once per logical step: a crash or a lost lease can cause
 * the same state to be handled again, so implementations must be idempotent.
 * A handler may throw; the engine records the attempt and retries after the
 * state's try interval.
 */
class IStateHandler {
public:
    virtual ~IStateHandler() = default;

    /**
     * @brief Attempt to progress the entity out of its current state
     * @return Target state (must be a declared transition) or nullopt to retry later
     */
    virtual TransitionResult handle(HandlerContext &context) = 0;
};

/**
 * @brief Adapts a callable to IStateHandler
 */
class FunctionHandler : public IStateHandler {
public:
    using Function = std::function<TransitionResult(HandlerContext &)>;

    explicit FunctionHandler(Function function) : function_(std::move(function)) {}

    TransitionResult handle(HandlerContext &context) override {
        return function_(context);
    }

private:
    Function function_;
};

}  // namespace RTE
