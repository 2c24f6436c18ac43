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

#include "runtime/GraphRegistry.h"

#include <stdexcept>

namespace RTE {

void GraphRegistry::add(std::shared_ptr<const StateGraph> graph) {
    if (!graph) {
        throw std::invalid_argument("GraphRegistry: graph cannot be null");
    }
    if (!byName_.emplace(graph->name(), graph).second) {
        throw std::invalid_argument("GraphRegistry: entity type '" + graph->name() + "' registered twice");
    }
    graphs_.push_back(std::move(graph));
}

std::shared_ptr<const StateGraph> GraphRegistry::find(const std::string &type) const {
    auto it = byName_.find(type);
    return it != byName_.end() ? it->second : nullptr;
}

}  // namespace RTE
