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

#include "storage/IEntityRepository.h"

#include <atomic>
#include <map>
#include <mutex>

namespace RTE {

/**
 * @brief Process-local repository guarded by a single mutex
 *
 * Gives the same atomicity as a single-statement update in a relational store.
 * Used by tests and by embedders whose workers all live in one process.
 * setAvailable(false) makes every call throw StorageError, which simulates an
 * unreachable store.
 */
class InMemoryEntityRepository : public IEntityRepository {
public:
    InMemoryEntityRepository() = default;

    std::optional<EntityRecord> fetch(const EntityKey &key) override;
    bool insert(const EntityRecord &record) override;
    std::vector<EntityRecord> fetchReadyBatch(const std::string &type, size_t limit, bool excludeLeased,
                                              Timestamp now, const std::vector<std::string> &states) override;
    bool conditionalUpdate(const EntityKey &key, const LeaseCondition &expected, const EntityUpdate &update) override;
    size_t bulkMarkReady(const std::string &type, const std::string &state, Timestamp cutoff) override;
    size_t clearExpiredLeases(const std::string &type, Timestamp now) override;
    size_t countReady(const std::string &type) override;

    void setAvailable(bool available) {
        available_ = available;
    }

    size_t size() const;

private:
    void checkAvailable() const;

    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, EntityRecord> records_;
    std::atomic<bool> available_{true};
};

}  // namespace RTE
