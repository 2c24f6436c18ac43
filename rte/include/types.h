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

#include <chrono>
#include <string>

namespace RTE {

using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

/**
 * @brief Identity of a managed entity: its type name and its primary key
 */
struct EntityKey {
    std::string type;
    std::string id;

    bool operator==(const EntityKey &other) const = default;

    std::string toString() const {
        return type + "#" + id;
    }
};

/**
 * @brief Logical state of a worker loop
 */
enum class WorkerState {
    RUNNING,   // Dispatching new work
    DRAINING,  // Shutdown requested, waiting for in-flight handlers
    STOPPED    // Terminal
};

inline const char *toString(WorkerState state) {
    switch (state) {
    case WorkerState::RUNNING:
        return "running";
    case WorkerState::DRAINING:
        return "draining";
    case WorkerState::STOPPED:
        return "stopped";
    }
    return "unknown";
}

}  // namespace RTE
