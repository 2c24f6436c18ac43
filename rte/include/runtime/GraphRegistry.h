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

#include "model/StateGraph.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief The entity types a process manages, keyed by graph name
 *
 * Filled at startup, then read concurrently without locking.
 */
class GraphRegistry {
public:
    /**
     * @throws std::invalid_argument on a null graph or a duplicate name
     */
    void add(std::shared_ptr<const StateGraph> graph);

    /**
     * @return Graph registered under `type`, or nullptr
     */
    std::shared_ptr<const StateGraph> find(const std::string &type) const;

    /**
     * @brief Registered graphs in registration order
     */
    const std::vector<std::shared_ptr<const StateGraph>> &graphs() const {
        return graphs_;
    }

    bool empty() const {
        return graphs_.empty();
    }

private:
    std::vector<std::shared_ptr<const StateGraph>> graphs_;
    std::map<std::string, std::shared_ptr<const StateGraph>> byName_;
};

}  // namespace RTE
