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

#include "common/JsonUtils.h"
#include "types.h"

#include <cstddef>
#include <string>

namespace RTE {

/**
 * @brief Process-wide settings, fixed at startup
 *
 * JSON keys (all optional, durations in seconds, fractions allowed):
 * concurrency, concurrency_per_type, lease_seconds, schedule_interval_seconds,
 * min_loop_delay_seconds, max_loop_delay_seconds, shutdown_grace_seconds,
 * run_for_seconds, watchdog, liveness_file, database, log_level,
 * log_directory, log_to_file.
 */
struct EngineConfig {
    size_t concurrency = 100;        // Handlers in flight per process
    size_t concurrencyPerType = 40;  // Handlers in flight per entity type
    Duration leaseDuration = std::chrono::seconds(300);
    Duration scheduleInterval = std::chrono::seconds(30);
    Duration minLoopDelay = std::chrono::milliseconds(500);
    Duration maxLoopDelay = std::chrono::seconds(5);
    Duration shutdownGrace = std::chrono::seconds(30);
    Duration runFor = Duration::zero();  // Zero: run until shut down
    bool watchdog = true;                // Stop the run when readiness rounds stall
    std::string livenessFile;
    std::string databasePath = "rte.sqlite3";
    std::string logLevel = "info";
    std::string logDirectory;
    bool logToFile = false;

    /**
     * @brief Overlay the keys present in `document` onto the defaults
     * @throws ConfigError on wrongly typed or invalid values
     */
    static EngineConfig fromJson(const json &document);

    /**
     * @throws ConfigError if the file is unreadable, malformed or invalid
     */
    static EngineConfig loadFile(const std::string &path);

    /**
     * @throws ConfigError describing the first invalid setting
     */
    void validate() const;

    json toJson() const;
};

}  // namespace RTE
