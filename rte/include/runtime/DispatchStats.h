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

#include <cstddef>
#include <map>
#include <mutex>
#include <string>

namespace RTE {

/**
 * @brief Per-type counters of handler invocations, shared by the worker loop and the scheduler
 */
class DispatchStats {
public:
    struct Counters {
        size_t handled = 0;      // Invocations started
        size_t transitions = 0;  // Invocations that moved the entity
        size_t failures = 0;     // Invocations that threw or returned an invalid target
        size_t lostLeases = 0;   // Results discarded because the lease was gone

        Counters &operator+=(const Counters &other) {
            handled += other.handled;
            transitions += other.transitions;
            failures += other.failures;
            lostLeases += other.lostLeases;
            return *this;
        }
    };

    void recordHandled(const std::string &type) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_[type].handled++;
        totals_[type].handled++;
    }

    void recordTransition(const std::string &type) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_[type].transitions++;
        totals_[type].transitions++;
    }

    void recordFailure(const std::string &type) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_[type].failures++;
        totals_[type].failures++;
    }

    void recordLostLease(const std::string &type) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_[type].lostLeases++;
        totals_[type].lostLeases++;
    }

    /**
     * @brief Counters accumulated since the previous call, then reset
     */
    std::map<std::string, Counters> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, Counters> result;
        result.swap(pending_);
        return result;
    }

    /**
     * @brief Counters since construction
     */
    std::map<std::string, Counters> totals() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return totals_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Counters> pending_;
    std::map<std::string, Counters> totals_;
};

}  // namespace RTE
