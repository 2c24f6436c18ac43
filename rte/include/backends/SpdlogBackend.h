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

#include "common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace RTE {

/**
 * @brief Default backend: one spdlog logger named "rte"
 *
 * Lines look like `[12:00:01.250] [warning] [4711] WorkerLoop: ...`, the bracketed
 * number being the thread id so a handler's records can be followed across the
 * pool. With a log directory and logToFile set, records are also appended to
 * <logDirectory>/rte.log. Warnings and errors are flushed immediately. The
 * starting level is info unless SPDLOG_LEVEL overrides it.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string &logDirectory = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace RTE
