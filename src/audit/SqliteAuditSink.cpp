#include "audit/SqliteAuditSink.h"
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

SqliteAuditSink::SqliteAuditSink(const std::string& dbPath) {
    fs::path p = fs::u8path(dbPath);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
    }

    if (sqlite3_open(p.string().c_str(), &db) != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        db = nullptr;
        throw std::runtime_error("Cannot open audit database " + dbPath + ": " + msg);
    }

    const char* createSql =
        "CREATE TABLE IF NOT EXISTS audit_entries ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "timestamp TEXT NOT NULL,"
        "stage TEXT NOT NULL,"
        "outcome TEXT NOT NULL,"
        "detail TEXT NOT NULL);";
    char* err = nullptr;
    if (sqlite3_exec(db, createSql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        sqlite3_close(db);
        db = nullptr;
        throw std::runtime_error("Cannot create audit table: " + msg);
    }
    sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
}

SqliteAuditSink::~SqliteAuditSink() {
    if (db) sqlite3_close(db);
}

void SqliteAuditSink::append(const AuditEntry& entry) {
    std::lock_guard<std::mutex> lock(mtx);
    const char* sql = "INSERT INTO audit_entries (timestamp, stage, outcome, detail) VALUES (?, ?, ?, ?);";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Audit insert prepare failed: ") + sqlite3_errmsg(db));
    }

    std::string stage = auditStageName(entry.stage);
    std::string outcome = auditOutcomeName(entry.outcome);
    std::string detail = entry.detail.dump();
    sqlite3_bind_text(stmt, 1, entry.timestamp.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, stage.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, outcome.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, detail.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Audit insert failed: ") + sqlite3_errmsg(db));
    }
}
