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
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>
#include <unistd.h>

namespace RTE {
namespace Test {
namespace Utils {

// Common Test Timing Constants
constexpr auto POLL_INTERVAL_MS = std::chrono::milliseconds(10);   // Polling interval for state checks
constexpr auto STANDARD_WAIT_MS = std::chrono::milliseconds(100);  // Standard wait time for async operations
constexpr auto LONG_WAIT_MS = std::chrono::milliseconds(2000);     // Upper bound for worker threads to settle

/**
 * @brief Check if running in Docker TSAN environment
 *
 * @return true if IN_DOCKER_TSAN is set to a truthy value (non-empty, not "0", not "false")
 */
inline bool isInDockerTsan() {
    const char *env = std::getenv("IN_DOCKER_TSAN");
    if (!env) {
        return false;
    }

    std::string value(env);
    return !value.empty() && value != "0" && value != "false";
}

/**
 * @brief Poll `predicate` until it holds or `timeout` passes
 *
 * TSAN runs get four times the timeout.
 * @return Final value of the predicate
 */
inline bool waitUntil(const std::function<bool()> &predicate,
                      std::chrono::milliseconds timeout = LONG_WAIT_MS) {
    if (isInDockerTsan()) {
        timeout *= 4;
    }
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(POLL_INTERVAL_MS);
    }
    return predicate();
}

/**
 * @brief Unique path under the system temp directory, removed (with SQLite side files or directory contents)
 * on destruction
 */
class TempPath {
public:
    explicit TempPath(const std::string &stem) {
        static int counter = 0;
        path_ = (std::filesystem::temp_directory_path() /
                 (stem + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++)))
                    .string();
        cleanup();
    }

    ~TempPath() {
        cleanup();
    }

    TempPath(const TempPath &) = delete;
    TempPath &operator=(const TempPath &) = delete;

    const std::string &str() const {
        return path_;
    }

private:
    void cleanup() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        for (const char *suffix : {"-wal", "-shm", "-journal"}) {
            std::filesystem::remove(path_ + suffix, ec);
        }
    }

    std::string path_;
};

}  // namespace Utils
}  // namespace Test
}  // namespace RTE
