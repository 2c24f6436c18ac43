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
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>

namespace RTE {

/**
 * @brief Process-wide logging facade
 *
 * All engine components log through the LOG_* macros below. The facade
 * forwards to one ILoggerBackend, created lazily (SpdlogBackend) unless a
 * backend was injected with setBackend().
 *
 * Thread-safe: backend replacement is serialized, and the backends themselves
 * are safe to call from worker threads.
 *
 * @code
 * RTE::Logger::initialize("/var/log/rte", true);
 * LOG_INFO("WorkerLoop: started with {} slots", config.concurrency);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject a custom backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize the default backend (console only)
     */
    static void initialize();

    /**
     * @brief Initialize the default backend with optional file output
     *
     * @param logDir Directory for the log file
     * @param logToFile Enable the file sink
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    /**
     * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off")
     * @return Level, or nullopt for unknown names
     */
    static std::optional<LogLevel> parseLevel(const std::string &name);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static void write(LogLevel level, const std::string &message, const std::source_location &loc);

    static std::unique_ptr<ILoggerBackend> backend_;
};

}  // namespace RTE

#define LOG_TRACE(...) RTE::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) RTE::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) RTE::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) RTE::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) RTE::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
