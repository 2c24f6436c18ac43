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

#include "common/Logger.h"
#include "backends/SpdlogBackend.h"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace RTE {

std::unique_ptr<ILoggerBackend> Logger::backend_;

// Guards backend_ replacement; logging itself relies on backend thread safety
static std::mutex backend_mutex;

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    initialize();
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_->setLevel(level);
}

std::optional<LogLevel> Logger::parseLevel(const std::string &name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") {
        return LogLevel::Trace;
    }
    if (lowered == "debug") {
        return LogLevel::Debug;
    }
    if (lowered == "info") {
        return LogLevel::Info;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::Warn;
    }
    if (lowered == "err" || lowered == "error") {
        return LogLevel::Error;
    }
    if (lowered == "critical") {
        return LogLevel::Critical;
    }
    if (lowered == "off") {
        return LogLevel::Off;
    }
    return std::nullopt;
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::flush() {
    initialize();
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_->flush();
}

void Logger::write(LogLevel level, const std::string &message, const std::source_location &loc) {
    if (!backend_) {
        initialize();
    }
    backend_->log(level, message, loc);
}

}  // namespace RTE
