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

#include "backends/SpdlogBackend.h"

#include <filesystem>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace RTE {

namespace {

constexpr const char *LOGGER_NAME = "rte";

spdlog::level::level_enum toSpdlog(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string &logDirectory, bool logToFile) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (logToFile && !logDirectory.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(logDirectory, ec);
        if (ec) {
            spdlog::warn("Cannot create log directory '{}': {}", logDirectory, ec.message());
        } else {
            auto path = (std::filesystem::path(logDirectory) / "rte.log").string();
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false));
        }
    }

    logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger_->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
    logger_->set_level(spdlog::level::info);
    logger_->flush_on(spdlog::level::warn);

    // SPDLOG_LEVEL applies to registered loggers only
    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(logger_);
    spdlog::cfg::load_env_levels();
}

void SpdlogBackend::log(LogLevel level, const std::string &message, const std::source_location &loc) {
    spdlog::source_loc source{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()};
    logger_->log(source, toSpdlog(level), "{}", message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(toSpdlog(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

}  // namespace RTE
