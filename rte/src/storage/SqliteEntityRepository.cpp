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

#include "storage/SqliteEntityRepository.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <sqlite3.h>

namespace RTE {

namespace {

// Index in the vector is the version the statement upgrades to, minus one
const std::vector<std::string> MIGRATIONS = {
    "CREATE TABLE IF NOT EXISTS rte_entities ("
    "  entity_type TEXT NOT NULL,"
    "  entity_id TEXT NOT NULL,"
    "  state TEXT NOT NULL,"
    "  ready INTEGER NOT NULL DEFAULT 1,"
    "  changed_at INTEGER NOT NULL,"
    "  last_attempted_at INTEGER NULL,"
    "  lease_expires_at INTEGER NULL,"
    "  PRIMARY KEY (entity_type, entity_id))",
    "CREATE INDEX IF NOT EXISTS rte_entities_ready_idx ON rte_entities (entity_type, ready, state)",
};

int64_t toMillis(Timestamp ts) {
    return std::chrono::duration_cast<Duration>(ts.time_since_epoch()).count();
}

Timestamp fromMillis(int64_t value) {
    return Timestamp(Duration(value));
}

const char *SELECT_COLUMNS =
    "SELECT entity_type, entity_id, state, ready, changed_at, last_attempted_at, lease_expires_at FROM rte_entities";

}  // namespace

/**
 * @brief RAII prepared statement with 1-based positional binding
 */
class SqliteEntityRepository::Statement {
public:
    Statement(SqliteEntityRepository &owner, const std::string &sql) : owner_(owner) {
        if (sqlite3_prepare_v2(owner_.db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            owner_.fail("prepare '" + sql + "'");
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    Statement &bind(const std::string &value) {
        check(sqlite3_bind_text(stmt_, ++index_, value.c_str(), -1, SQLITE_TRANSIENT));
        return *this;
    }

    Statement &bind(int64_t value) {
        check(sqlite3_bind_int64(stmt_, ++index_, value));
        return *this;
    }

    Statement &bind(Timestamp value) {
        return bind(toMillis(value));
    }

    Statement &bind(const std::optional<Timestamp> &value) {
        if (value) {
            return bind(*value);
        }
        check(sqlite3_bind_null(stmt_, ++index_));
        return *this;
    }

    /**
     * @return true while a row is available
     */
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        if (rc == SQLITE_CONSTRAINT) {
            throw ConstraintViolation();
        }
        owner_.fail("step");
    }

    int64_t columnInt(int column) const {
        return sqlite3_column_int64(stmt_, column);
    }

    std::string columnText(int column) const {
        const auto *text = sqlite3_column_text(stmt_, column);
        return text ? reinterpret_cast<const char *>(text) : std::string();
    }

    std::optional<Timestamp> columnTimestamp(int column) const {
        if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
            return std::nullopt;
        }
        return fromMillis(columnInt(column));
    }

    EntityRecord record() const {
        EntityRecord record;
        record.key = EntityKey{columnText(0), columnText(1)};
        record.state = columnText(2);
        record.ready = columnInt(3) != 0;
        record.changedAt = fromMillis(columnInt(4));
        record.lastAttemptedAt = columnTimestamp(5);
        record.leaseExpiresAt = columnTimestamp(6);
        return record;
    }

    struct ConstraintViolation {};

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            owner_.fail("bind");
        }
    }

    SqliteEntityRepository &owner_;
    sqlite3_stmt *stmt_ = nullptr;
    int index_ = 0;
};

SqliteEntityRepository::SqliteEntityRepository(const std::string &path, Duration busyTimeout) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("SqliteEntityRepository: cannot open '" + path + "': " + message);
    }

    sqlite3_busy_timeout(db_, static_cast<int>(busyTimeout.count()));
    if (path != ":memory:") {
        exec("PRAGMA journal_mode=WAL");
    }
    migrate();
    LOG_INFO("SqliteEntityRepository: Opened '{}' (schema v{})", path_, CURRENT_SCHEMA_VERSION);
}

SqliteEntityRepository::~SqliteEntityRepository() {
    if (db_) {
        sqlite3_close_v2(db_);
    }
}

void SqliteEntityRepository::exec(const std::string &sql) {
    char *error = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "unknown error";
        sqlite3_free(error);
        throw StorageError("SqliteEntityRepository: '" + sql + "' failed: " + message);
    }
}

void SqliteEntityRepository::fail(const std::string &operation) {
    throw StorageError("SqliteEntityRepository: " + operation + " failed on '" + path_ + "': " + sqlite3_errmsg(db_));
}

void SqliteEntityRepository::migrate() {
    std::lock_guard<std::mutex> lock(mutex_);
    exec("CREATE TABLE IF NOT EXISTS rte_schema_version (version INTEGER NOT NULL)");

    int current = 0;
    {
        Statement select(*this, "SELECT MAX(version) FROM rte_schema_version");
        if (select.step()) {
            current = static_cast<int>(select.columnInt(0));
        }
    }

    for (int version = current + 1; version <= static_cast<int>(MIGRATIONS.size()); ++version) {
        exec("BEGIN IMMEDIATE");
        try {
            exec(MIGRATIONS[version - 1]);
            Statement record(*this, "INSERT INTO rte_schema_version (version) VALUES (?)");
            record.bind(static_cast<int64_t>(version)).step();
            exec("COMMIT");
        } catch (const StorageError &) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            throw;
        }
        LOG_DEBUG("SqliteEntityRepository: Applied schema migration v{}", version);
    }
}

int SqliteEntityRepository::schemaVersion() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement select(*this, "SELECT MAX(version) FROM rte_schema_version");
    return select.step() ? static_cast<int>(select.columnInt(0)) : 0;
}

std::optional<EntityRecord> SqliteEntityRepository::fetch(const EntityKey &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement select(*this, std::string(SELECT_COLUMNS) + " WHERE entity_type = ? AND entity_id = ?");
    select.bind(key.type).bind(key.id);
    if (!select.step()) {
        return std::nullopt;
    }
    return select.record();
}

bool SqliteEntityRepository::insert(const EntityRecord &record) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement insert(*this, "INSERT INTO rte_entities (entity_type, entity_id, state, ready, changed_at, "
                            "last_attempted_at, lease_expires_at) VALUES (?, ?, ?, ?, ?, ?, ?)");
    insert.bind(record.key.type)
        .bind(record.key.id)
        .bind(record.state)
        .bind(static_cast<int64_t>(record.ready ? 1 : 0))
        .bind(record.changedAt)
        .bind(record.lastAttemptedAt)
        .bind(record.leaseExpiresAt);
    try {
        insert.step();
    } catch (const Statement::ConstraintViolation &) {
        return false;
    }
    return sqlite3_changes(db_) == 1;
}

std::vector<EntityRecord> SqliteEntityRepository::fetchReadyBatch(const std::string &type, size_t limit,
                                                                  bool excludeLeased, Timestamp now,
                                                                  const std::vector<std::string> &states) {
    std::vector<EntityRecord> result;
    if (limit == 0 || states.empty()) {
        return result;
    }

    std::string sql = std::string(SELECT_COLUMNS) + " WHERE entity_type = ? AND ready = 1 AND state IN (";
    for (size_t i = 0; i < states.size(); ++i) {
        sql += i == 0 ? "?" : ", ?";
    }
    sql += ")";
    if (excludeLeased) {
        sql += " AND (lease_expires_at IS NULL OR lease_expires_at < ?)";
    }
    sql += " ORDER BY changed_at LIMIT ?";

    std::lock_guard<std::mutex> lock(mutex_);
    Statement select(*this, sql);
    select.bind(type);
    for (const auto &state : states) {
        select.bind(state);
    }
    if (excludeLeased) {
        select.bind(now);
    }
    select.bind(static_cast<int64_t>(limit));

    while (select.step()) {
        result.push_back(select.record());
    }
    return result;
}

bool SqliteEntityRepository::conditionalUpdate(const EntityKey &key, const LeaseCondition &expected,
                                               const EntityUpdate &update) {
    std::string assignments;
    auto assign = [&assignments](const char *column) {
        assignments += assignments.empty() ? "" : ", ";
        assignments += column;
        assignments += " = ?";
    };
    if (update.state) {
        assign("state");
    }
    if (update.ready) {
        assign("ready");
    }
    if (update.changedAt) {
        assign("changed_at");
    }
    if (update.lastAttemptedAt) {
        assign("last_attempted_at");
    }
    if (update.leaseExpiresAt) {
        assign("lease_expires_at");
    }
    if (assignments.empty()) {
        // Pure precondition check
        assignments = "entity_id = entity_id";
    }

    std::string sql = "UPDATE rte_entities SET " + assignments + " WHERE entity_type = ? AND entity_id = ?";
    switch (expected.kind) {
    case LeaseCondition::Kind::ANY:
        break;
    case LeaseCondition::Kind::UNLEASED:
        sql += " AND (lease_expires_at IS NULL OR lease_expires_at < ?)";
        break;
    case LeaseCondition::Kind::HELD_UNTIL:
        sql += " AND lease_expires_at = ?";
        break;
    }
    if (expected.readyInState) {
        sql += " AND ready = 1 AND state = ?";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Statement statement(*this, sql);
    if (update.state) {
        statement.bind(*update.state);
    }
    if (update.ready) {
        statement.bind(static_cast<int64_t>(*update.ready ? 1 : 0));
    }
    if (update.changedAt) {
        statement.bind(*update.changedAt);
    }
    if (update.lastAttemptedAt) {
        statement.bind(*update.lastAttemptedAt);
    }
    if (update.leaseExpiresAt) {
        statement.bind(*update.leaseExpiresAt);
    }
    statement.bind(key.type).bind(key.id);
    if (expected.kind == LeaseCondition::Kind::UNLEASED) {
        statement.bind(expected.now);
    } else if (expected.kind == LeaseCondition::Kind::HELD_UNTIL) {
        statement.bind(expected.expiresAt);
    }
    if (expected.readyInState) {
        statement.bind(*expected.readyInState);
    }

    statement.step();
    return sqlite3_changes(db_) == 1;
}

size_t SqliteEntityRepository::bulkMarkReady(const std::string &type, const std::string &state, Timestamp cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement update(*this, "UPDATE rte_entities SET ready = 1 WHERE entity_type = ? AND state = ? AND ready = 0 "
                            "AND (last_attempted_at IS NULL OR last_attempted_at <= ?)");
    update.bind(type).bind(state).bind(cutoff);
    update.step();
    return static_cast<size_t>(sqlite3_changes(db_));
}

size_t SqliteEntityRepository::clearExpiredLeases(const std::string &type, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement update(*this, "UPDATE rte_entities SET lease_expires_at = NULL "
                            "WHERE entity_type = ? AND lease_expires_at < ?");
    update.bind(type).bind(now);
    update.step();
    return static_cast<size_t>(sqlite3_changes(db_));
}

size_t SqliteEntityRepository::countReady(const std::string &type) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement select(*this, "SELECT COUNT(*) FROM rte_entities WHERE entity_type = ? AND ready = 1");
    select.bind(type);
    return select.step() ? static_cast<size_t>(select.columnInt(0)) : 0;
}

}  // namespace RTE
