#include "lifecycle_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

LifecycleDb::LifecycleDb() = default;

LifecycleDb::~LifecycleDb() {
    close();
}

bool LifecycleDb::open(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    char* err = nullptr;
    if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err) != SQLITE_OK) {
        std::println(stderr, "db: could not enable WAL: {}", err ? err : "unknown");
        sqlite3_free(err);
    }

    if (!create_tables()) {
        close();
        return false;
    }

    const char* insert_sql =
        "INSERT INTO events (tool, event, pid, detail) VALUES (?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, tool, event, pid, detail "
        "FROM events ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare recent failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    return true;
}

void LifecycleDb::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool LifecycleDb::insert(const std::string& tool, const std::string& event, int pid,
                         const std::string& detail) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, tool.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, event.c_str(), -1, SQLITE_TRANSIENT);

    if (pid > 0) sqlite3_bind_int(insert_stmt_, 3, pid);
    else sqlite3_bind_null(insert_stmt_, 3);

    if (detail.empty()) sqlite3_bind_null(insert_stmt_, 4);
    else sqlite3_bind_text(insert_stmt_, 4, detail.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<LifecycleEvent> LifecycleDb::recent(int limit) {
    std::vector<LifecycleEvent> events;
    if (!recent_stmt_) return events;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        LifecycleEvent e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = get_text(recent_stmt_, 1);
        e.tool = get_text(recent_stmt_, 2);
        e.event = get_text(recent_stmt_, 3);
        e.pid = sqlite3_column_int(recent_stmt_, 4);
        e.detail = get_text(recent_stmt_, 5);
        events.push_back(std::move(e));
    }

    return events;
}

bool LifecycleDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS events (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            tool TEXT NOT NULL,
            event TEXT NOT NULL,
            pid INTEGER,
            detail TEXT
        );
        CREATE INDEX IF NOT EXISTS events_tool ON events(tool);
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
