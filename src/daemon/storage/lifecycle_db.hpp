#pragma once

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct LifecycleEvent {
    int64_t id;
    std::string timestamp;
    std::string tool;    // slug
    std::string event;   // started, start_failed, stopped, exited, adopted, lost
    int pid;             // 0 when unknown
    std::string detail;
};

class LifecycleDb {
public:
    LifecycleDb();
    ~LifecycleDb();

    LifecycleDb(const LifecycleDb&) = delete;
    LifecycleDb& operator=(const LifecycleDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const std::string& tool, const std::string& event, int pid,
                const std::string& detail = {});

    // Newest first.
    std::vector<LifecycleEvent> recent(int limit = 20);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
