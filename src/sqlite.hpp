#pragma once

#include <sqlite3.h>

#include <array>
#include <mutex>
#include <string>

#include "usage_log.hpp"

class SQLite : public UsageLog {
  public:
    SQLite(const std::string &db_path);
    ~SQLite() override;

    SQLite(const SQLite &) = delete;
    SQLite &operator=(const SQLite &) = delete;

    bool AppendBatch(const std::vector<UsageRecord> &records) override;
    std::vector<UsageRecord> FetchRecent(std::int64_t since_unix, int limit) override;
    int PruneOlderThan(std::int64_t cutoff_unix) override;

    // Distinct identifiers ever persisted, -1 on failure.
    int CountKnownIdentifiers();

  private:
    void Init();
    void PrepareStatements();
    bool Exec(const char *sql);
    void ExecIgnoringErrors(const std::string &sql);
    bool InsertRecord(const UsageRecord &record);

  private:
    sqlite3 *m_Db;
    std::string m_DbPath;
    std::mutex m_DbMutex;

    sqlite3_stmt *m_InsertUsageStmt = nullptr;
    sqlite3_stmt *m_RecentUsageStmt = nullptr;

    // Small deterministic lookaside buffer to reduce heap churn.
    static constexpr int kLookasideSlotSize = 128;
    static constexpr int kLookasideSlotCount = 256; // 32 KiB
    std::array<unsigned char, kLookasideSlotSize * kLookasideSlotCount> m_Lookaside{};
};
