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

#include <source_location>
#include <string>

namespace RTE {

/**
 * @brief Severity of an engine log record
 *
 * Warn marks lost leases and store outages the loop recovers from; Error marks
 * handler failures and rejected transitions. Values follow spdlog's order.
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Sink for everything the worker loop, scheduler and stores report
 *
 * Records arrive already formatted, from the dispatching thread, every pool
 * thread and the readiness timer thread at once, so implementations must be
 * thread-safe. Logger owns the active backend; SpdlogBackend is installed
 * unless another one is injected (tests record into memory this way).
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @param loc Call site of the LOG_* macro
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Called before the worker process exits
     */
    virtual void flush() = 0;
};

}  // namespace RTE
