#pragma once
#include <mutex>
#include <string>
#include "audit/AuditSink.h"

struct sqlite3;

/**
 * @brief Audit trail stored in an append-only SQLite table.
 *
 * Table: audit_entries(id, timestamp, stage, outcome, detail)
 */
class SqliteAuditSink : public AuditSink {
public:
    explicit SqliteAuditSink(const std::string& dbPath);
    ~SqliteAuditSink() override;

    SqliteAuditSink(const SqliteAuditSink&) = delete;
    SqliteAuditSink& operator=(const SqliteAuditSink&) = delete;

    void append(const AuditEntry& entry) override;

private:
    sqlite3* db = nullptr;
    std::mutex mtx;
};
