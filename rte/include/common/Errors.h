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

#include <stdexcept>
#include <string>

namespace RTE {

/**
 * @brief Malformed StateGraph; fatal at process start
 */
class GraphDefinitionError : public std::logic_error {
public:
    GraphDefinitionError(const std::string &graphName, const std::string &reason)
        : std::logic_error("StateGraph '" + graphName + "': " + reason), graphName_(graphName) {}

    const std::string &graphName() const {
        return graphName_;
    }

private:
    std::string graphName_;
};

/**
 * @brief The backing store rejected or failed an operation
 *
 * Treated as transient by the worker loop (logged, then retried after backoff).
 */
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Invalid or unreadable engine configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

}  // namespace RTE
