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

#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace RTE {

/**
 * @brief IEntityRepository over an SQLite database
 *
 * Opening the database applies the schema migrations that are still missing.
 * Each operation is one SQL statement, so conditional updates are atomic even
 * when several worker processes share the same database file (WAL mode,
 * busy timeout). Timestamps are stored as milliseconds since the Unix epoch.
 */
class SqliteEntityRepository : public IEntityRepository {
public:
    /**
     * @param path Database file, or ":memory:" for a private in-memory database
     * @param busyTimeout How long a statement waits on a lock held by another connection
     * @throws StorageError if the database cannot be opened or migrated
     */
    explicit SqliteEntityRepository(const std::string &path, Duration busyTimeout = Duration(5000));
    ~SqliteEntityRepository();

    SqliteEntityRepository(const SqliteEntityRepository &) = delete;
    SqliteEntityRepository &operator=(const SqliteEntityRepository &) = delete;

    std::optional<EntityRecord> fetch(const EntityKey &key) override;
    bool insert(const EntityRecord &record) override;
    std::vector<EntityRecord> fetchReadyBatch(const std::string &type, size_t limit, bool excludeLeased,
                                              Timestamp now, const std::vector<std::string> &states) override;
    bool conditionalUpdate(const EntityKey &key, const LeaseCondition &expected, const EntityUpdate &update) override;
    size_t bulkMarkReady(const std::string &type, const std::string &state, Timestamp cutoff) override;
    size_t clearExpiredLeases(const std::string &type, Timestamp now) override;
    size_t countReady(const std::string &type) override;

    /**
     * @brief Schema version after migrations were applied
     */
    int schemaVersion();

    static constexpr int CURRENT_SCHEMA_VERSION = 2;

private:
    class Statement;

    void migrate();
    void exec(const std::string &sql);
    [[noreturn]] void fail(const std::string &operation);

    sqlite3 *db_ = nullptr;
    std::string path_;
    std::mutex mutex_;
};

}  // namespace RTE
