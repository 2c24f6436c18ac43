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

#include "common/EngineConfig.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <cmath>

namespace RTE {

namespace {

// 100 years; now + duration must stay representable as a nanosecond time_point
constexpr double MAX_SECONDS = 100.0 * 365 * 24 * 3600;

Duration secondsToDuration(double seconds) {
    return Duration(static_cast<Duration::rep>(std::llround(seconds * 1000.0)));
}

double durationToSeconds(Duration value) {
    return static_cast<double>(value.count()) / 1000.0;
}

}  // namespace

EngineConfig EngineConfig::fromJson(const json &document) {
    if (!document.is_object()) {
        throw ConfigError("EngineConfig: configuration must be a JSON object");
    }

    EngineConfig config;
    std::string error;

    auto readCount = [&](const char *key, size_t &target) {
        if (auto value = JsonUtils::getInt(document, key, &error)) {
            if (*value <= 0) {
                throw ConfigError(std::string("EngineConfig: '") + key + "' must be positive");
            }
            target = static_cast<size_t>(*value);
        }
    };
    auto readSeconds = [&](const char *key, Duration &target) {
        if (auto value = JsonUtils::getNumber(document, key, &error)) {
            if (*value < 0 || !std::isfinite(*value)) {
                throw ConfigError(std::string("EngineConfig: '") + key + "' cannot be negative");
            }
            if (*value > MAX_SECONDS) {
                throw ConfigError(std::string("EngineConfig: '") + key + "' is out of range");
            }
            target = secondsToDuration(*value);
        }
    };
    auto readString = [&](const char *key, std::string &target) {
        if (auto value = JsonUtils::getString(document, key, &error)) {
            target = *value;
        }
    };

    readCount("concurrency", config.concurrency);
    readCount("concurrency_per_type", config.concurrencyPerType);
    readSeconds("lease_seconds", config.leaseDuration);
    readSeconds("schedule_interval_seconds", config.scheduleInterval);
    readSeconds("min_loop_delay_seconds", config.minLoopDelay);
    readSeconds("max_loop_delay_seconds", config.maxLoopDelay);
    readSeconds("shutdown_grace_seconds", config.shutdownGrace);
    readSeconds("run_for_seconds", config.runFor);
    readString("liveness_file", config.livenessFile);
    readString("database", config.databasePath);
    readString("log_level", config.logLevel);
    readString("log_directory", config.logDirectory);
    if (auto value = JsonUtils::getBool(document, "log_to_file", &error)) {
        config.logToFile = *value;
    }
    if (auto value = JsonUtils::getBool(document, "watchdog", &error)) {
        config.watchdog = *value;
    }

    if (!error.empty()) {
        throw ConfigError("EngineConfig: " + error);
    }

    config.validate();
    return config;
}

EngineConfig EngineConfig::loadFile(const std::string &path) {
    std::string error;
    auto document = JsonUtils::parseFile(path, &error);
    if (!document) {
        throw ConfigError("EngineConfig: cannot load '" + path + "': " + error);
    }
    auto config = fromJson(*document);
    LOG_DEBUG("EngineConfig: Loaded '{}': {}", path, JsonUtils::toPrettyString(config.toJson()));
    return config;
}

void EngineConfig::validate() const {
    if (concurrency == 0) {
        throw ConfigError("EngineConfig: concurrency must be positive");
    }
    if (concurrencyPerType == 0) {
        throw ConfigError("EngineConfig: concurrency_per_type must be positive");
    }
    if (leaseDuration <= Duration::zero()) {
        throw ConfigError("EngineConfig: lease_seconds must be positive");
    }
    if (scheduleInterval <= Duration::zero()) {
        throw ConfigError("EngineConfig: schedule_interval_seconds must be positive");
    }
    if (minLoopDelay <= Duration::zero()) {
        throw ConfigError("EngineConfig: min_loop_delay_seconds must be positive");
    }
    if (maxLoopDelay < minLoopDelay) {
        throw ConfigError("EngineConfig: max_loop_delay_seconds must not be below min_loop_delay_seconds");
    }
    if (shutdownGrace < Duration::zero() || runFor < Duration::zero()) {
        throw ConfigError("EngineConfig: durations cannot be negative");
    }
    if (!Logger::parseLevel(logLevel)) {
        throw ConfigError("EngineConfig: unknown log_level '" + logLevel + "'");
    }
}

json EngineConfig::toJson() const {
    return json{
        {"concurrency", concurrency},
        {"concurrency_per_type", concurrencyPerType},
        {"lease_seconds", durationToSeconds(leaseDuration)},
        {"schedule_interval_seconds", durationToSeconds(scheduleInterval)},
        {"min_loop_delay_seconds", durationToSeconds(minLoopDelay)},
        {"max_loop_delay_seconds", durationToSeconds(maxLoopDelay)},
        {"shutdown_grace_seconds", durationToSeconds(shutdownGrace)},
        {"run_for_seconds", durationToSeconds(runFor)},
        {"watchdog", watchdog},
        {"liveness_file", livenessFile},
        {"database", databasePath},
        {"log_level", logLevel},
        {"log_directory", logDirectory},
        {"log_to_file", logToFile},
    };
}

}  // namespace RTE
