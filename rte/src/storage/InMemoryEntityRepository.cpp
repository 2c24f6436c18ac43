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

#include "storage/InMemoryEntityRepository.h"
#include "common/Errors.h"

#include <algorithm>

namespace RTE {

void InMemoryEntityRepository::checkAvailable() const {
    if (!available_) {
        throw StorageError("InMemoryEntityRepository: store unavailable");
    }
}

std::optional<EntityRecord> InMemoryEntityRepository::fetch(const EntityKey &key) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find({key.type, key.id});
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryEntityRepository::insert(const EntityRecord &record) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.emplace(std::make_pair(record.key.type, record.key.id), record).second;
}

std::vector<EntityRecord> InMemoryEntityRepository::fetchReadyBatch(const std::string &type, size_t limit,
                                                                    bool excludeLeased, Timestamp now,
                                                                    const std::vector<std::string> &states) {
    checkAvailable();
    std::vector<EntityRecord> result;
    if (limit == 0 || states.empty()) {
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.lower_bound({type, std::string()});
        for (; it != records_.end() && it->first.first == type; ++it) {
            const auto &record = it->second;
            if (!record.ready) {
                continue;
            }
            if (excludeLeased && record.isLeased(now)) {
                continue;
            }
            if (std::find(states.begin(), states.end(), record.state) == states.end()) {
                continue;
            }
            result.push_back(record);
        }
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const EntityRecord &a, const EntityRecord &b) { return a.changedAt < b.changedAt; });
    if (result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

bool InMemoryEntityRepository::conditionalUpdate(const EntityKey &key, const LeaseCondition &expected,
                                                 const EntityUpdate &update) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find({key.type, key.id});
    if (it == records_.end() || !expected.matches(it->second)) {
        return false;
    }
    update.applyTo(it->second);
    return true;
}

size_t InMemoryEntityRepository::bulkMarkReady(const std::string &type, const std::string &state, Timestamp cutoff) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    size_t flipped = 0;
    auto it = records_.lower_bound({type, std::string()});
    for (; it != records_.end() && it->first.first == type; ++it) {
        auto &record = it->second;
        if (record.ready || record.state != state) {
            continue;
        }
        if (!record.lastAttemptedAt || *record.lastAttemptedAt <= cutoff) {
            record.ready = true;
            ++flipped;
        }
    }
    return flipped;
}

size_t InMemoryEntityRepository::clearExpiredLeases(const std::string &type, Timestamp now) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    size_t cleared = 0;
    auto it = records_.lower_bound({type, std::string()});
    for (; it != records_.end() && it->first.first == type; ++it) {
        auto &record = it->second;
        if (record.leaseExpiresAt && *record.leaseExpiresAt < now) {
            record.leaseExpiresAt.reset();
            ++cleared;
        }
    }
    return cleared;
}

size_t InMemoryEntityRepository::countReady(const std::string &type) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    auto it = records_.lower_bound({type, std::string()});
    for (; it != records_.end() && it->first.first == type; ++it) {
        if (it->second.ready) {
            ++count;
        }
    }
    return count;
}

size_t InMemoryEntityRepository::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}  // namespace RTE
