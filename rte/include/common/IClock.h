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
#include <mutex>

namespace RTE {

/**
 * @brief Source of wall-clock timestamps for scheduling decisions
 *
 * Every timestamp the engine writes into an EntityRecord comes from an IClock,
 * so tests can drive lease expiry and retry intervals deterministically.
 * Sleeping between loop iterations always uses the real steady clock.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual Timestamp now() const = 0;
};

class SystemClock : public IClock {
public:
    Timestamp now() const override {
        return std::chrono::time_point_cast<Duration>(Clock::now());
    }
};

/**
 * @brief Manually advanced clock, thread-safe
 */
class ManualClock : public IClock {
public:
    explicit ManualClock(Timestamp start = Timestamp{std::chrono::hours(24 * 365 * 50)}) : now_(start) {}

    Timestamp now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(Duration delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

    void set(Timestamp value) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = value;
    }

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

}  // namespace RTE
