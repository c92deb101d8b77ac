#include "sqlite.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

// ─────────────────────────────────────
SQLite::SQLite(const std::string &db_path) : m_Db(nullptr), m_DbPath(db_path) {
    if (sqlite3_open(m_DbPath.c_str(), &m_Db) != SQLITE_OK) {
        spdlog::error("unable to open database {}: {}", m_DbPath,
                      m_Db ? sqlite3_errmsg(m_Db) : "out of memory");
        sqlite3_close(m_Db);
        m_Db = nullptr;
        throw std::runtime_error("unable to open database: " + m_DbPath);
    }

    spdlog::debug("SQLite database opened: {}", m_DbPath);

    sqlite3_db_config(m_Db, SQLITE_DBCONFIG_LOOKASIDE, m_Lookaside.data(), kLookasideSlotSize,
                      kLookasideSlotCount);

    sqlite3_busy_timeout(m_Db, 2000);
    ExecIgnoringErrors("PRAGMA journal_mode=WAL");
    ExecIgnoringErrors("PRAGMA wal_autocheckpoint=1000");
    ExecIgnoringErrors("PRAGMA journal_size_limit=10485760");
    ExecIgnoringErrors("PRAGMA synchronous=NORMAL");
    ExecIgnoringErrors("PRAGMA temp_store=FILE");
    ExecIgnoringErrors("PRAGMA cache_size = -1000;");

    Init();
    PrepareStatements();
}

// ─────────────────────────────────────
SQLite::~SQLite() {
    if (m_InsertUsageStmt) {
        sqlite3_finalize(m_InsertUsageStmt);
        m_InsertUsageStmt = nullptr;
    }
    if (m_RecentUsageStmt) {
        sqlite3_finalize(m_RecentUsageStmt);
        m_RecentUsageStmt = nullptr;
    }
    if (m_Db) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
    }
}

// ─────────────────────────────────────
void SQLite::Init() {
    spdlog::debug("Initializing SQLite database tables");

    const bool ok = Exec("CREATE TABLE IF NOT EXISTS usage_logs ("
                         "id INTEGER PRIMARY KEY,"
                         "identifier TEXT NOT NULL,"
                         "app_name TEXT NOT NULL,"
                         "window_title TEXT NOT NULL,"
                         "url TEXT,"
                         "timestamp INTEGER NOT NULL,"
                         "duration INTEGER NOT NULL"
                         ")") &&
                    Exec("CREATE INDEX IF NOT EXISTS idx_usage_logs_timestamp "
                         "ON usage_logs(timestamp)");
    if (!ok) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
        throw std::runtime_error("unable to create usage_logs in " + m_DbPath);
    }

    spdlog::debug("SQLite database tables initialized");
}

// ─────────────────────────────────────
void SQLite::PrepareStatements() {
    {
        const char *sql = R"(
            INSERT INTO usage_logs
            (identifier, app_name, window_title, url, timestamp, duration)
            VALUES (?, ?, ?, ?, ?, ?)
        )";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_InsertUsageStmt, nullptr) != SQLITE_OK) {
            spdlog::error("db prepare failed for InsertUsage stmt: {}", sqlite3_errmsg(m_Db));
            m_InsertUsageStmt = nullptr;
        }
    }

    {
        const char *sql = R"(
            SELECT identifier, app_name, window_title, url, timestamp, duration
            FROM usage_logs
            WHERE timestamp >= ?
            ORDER BY timestamp DESC, id DESC
            LIMIT ?
        )";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_RecentUsageStmt, nullptr) != SQLITE_OK) {
            spdlog::error("db prepare failed for RecentUsage stmt: {}", sqlite3_errmsg(m_Db));
            m_RecentUsageStmt = nullptr;
        }
    }
}

// ─────────────────────────────────────
bool SQLite::InsertRecord(const UsageRecord &record) {
    sqlite3_reset(m_InsertUsageStmt);
    sqlite3_clear_bindings(m_InsertUsageStmt);

    sqlite3_bind_text(m_InsertUsageStmt, 1, record.identifier.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(m_InsertUsageStmt, 2, record.app_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(m_InsertUsageStmt, 3, record.window_title.c_str(), -1, SQLITE_TRANSIENT);
    if (record.url) {
        sqlite3_bind_text(m_InsertUsageStmt, 4, record.url->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(m_InsertUsageStmt, 4);
    }
    sqlite3_bind_int64(m_InsertUsageStmt, 5, record.timestamp);
    sqlite3_bind_int64(m_InsertUsageStmt, 6, record.duration);

    const int rc = sqlite3_step(m_InsertUsageStmt);
    if (rc != SQLITE_DONE) {
        spdlog::error("InsertUsage failed for '{}': {}", record.identifier, sqlite3_errmsg(m_Db));
        return false;
    }
    return true;
}

// ─────────────────────────────────────
bool SQLite::AppendBatch(const std::vector<UsageRecord> &records) {
    if (records.empty()) {
        return true;
    }

    std::lock_guard<std::mutex> lock(m_DbMutex);
    if (!m_InsertUsageStmt) {
        spdlog::error("InsertUsage stmt not prepared");
        return false;
    }

    if (!Exec("BEGIN IMMEDIATE")) {
        return false;
    }

    for (const auto &record : records) {
        if (!InsertRecord(record)) {
            sqlite3_reset(m_InsertUsageStmt);
            ExecIgnoringErrors("ROLLBACK");
            return false;
        }
    }
    sqlite3_reset(m_InsertUsageStmt);

    if (!Exec("COMMIT")) {
        ExecIgnoringErrors("ROLLBACK");
        return false;
    }

    spdlog::debug("Committed {} usage records", records.size());
    return true;
}

// ─────────────────────────────────────
std::vector<UsageRecord> SQLite::FetchRecent(std::int64_t since_unix, int limit) {
    std::vector<UsageRecord> rows;

    std::lock_guard<std::mutex> lock(m_DbMutex);
    if (!m_RecentUsageStmt) {
        spdlog::error("RecentUsage stmt not prepared");
        return rows;
    }

    sqlite3_reset(m_RecentUsageStmt);
    sqlite3_clear_bindings(m_RecentUsageStmt);
    sqlite3_bind_int64(m_RecentUsageStmt, 1, since_unix);
    sqlite3_bind_int(m_RecentUsageStmt, 2, limit);

    int rc;
    while ((rc = sqlite3_step(m_RecentUsageStmt)) == SQLITE_ROW) {
        UsageRecord r;
        const char *identifier =
            reinterpret_cast<const char *>(sqlite3_column_text(m_RecentUsageStmt, 0));
        const char *app = reinterpret_cast<const char *>(sqlite3_column_text(m_RecentUsageStmt, 1));
        const char *title =
            reinterpret_cast<const char *>(sqlite3_column_text(m_RecentUsageStmt, 2));
        r.identifier = identifier ? identifier : "";
        r.app_name = app ? app : "";
        r.window_title = title ? title : "";
        if (sqlite3_column_type(m_RecentUsageStmt, 3) != SQLITE_NULL) {
            const char *url =
                reinterpret_cast<const char *>(sqlite3_column_text(m_RecentUsageStmt, 3));
            r.url = url ? url : "";
        }
        r.timestamp = sqlite3_column_int64(m_RecentUsageStmt, 4);
        r.duration = sqlite3_column_int64(m_RecentUsageStmt, 5);
        rows.push_back(std::move(r));
    }

    if (rc != SQLITE_DONE) {
        spdlog::error("FetchRecent failed: {}", sqlite3_errmsg(m_Db));
    }
    sqlite3_reset(m_RecentUsageStmt);

    spdlog::debug("Fetched {} recent usage records", rows.size());
    return rows;
}

// ─────────────────────────────────────
int SQLite::PruneOlderThan(std::int64_t cutoff_unix) {
    std::lock_guard<std::mutex> lock(m_DbMutex);

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, "DELETE FROM usage_logs WHERE timestamp < ?", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in PruneOlderThan: {}", sqlite3_errmsg(m_Db));
        return -1;
    }

    sqlite3_bind_int64(stmt, 1, cutoff_unix);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        spdlog::error("PruneOlderThan failed: {}", sqlite3_errmsg(m_Db));
        return -1;
    }

    const int removed = sqlite3_changes(m_Db);
    if (removed > 0) {
        spdlog::info("Pruned {} usage records older than {}", removed, cutoff_unix);
    }
    return removed;
}

// ─────────────────────────────────────
int SQLite::CountKnownIdentifiers() {
    std::lock_guard<std::mutex> lock(m_DbMutex);

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, "SELECT COUNT(DISTINCT identifier) FROM usage_logs", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in CountKnownIdentifiers: {}", sqlite3_errmsg(m_Db));
        return -1;
    }

    int count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    } else {
        spdlog::error("CountKnownIdentifiers failed: {}", sqlite3_errmsg(m_Db));
    }
    sqlite3_finalize(stmt);
    return count;
}

// ─────────────────────────────────────
bool SQLite::Exec(const char *sql) {
    char *errmsg = nullptr;
    const int rc = sqlite3_exec(m_Db, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        spdlog::error("sqlite exec '{}' failed: {}", sql, errmsg ? errmsg : sqlite3_errstr(rc));
        sqlite3_free(errmsg);
        return false;
    }
    return true;
}

// ─────────────────────────────────────
void SQLite::ExecIgnoringErrors(const std::string &sql) {
    char *errmsg = nullptr;
    sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (errmsg) {
        spdlog::error("sqlite exec error: {}", errmsg);
        sqlite3_free(errmsg);
    }
}
