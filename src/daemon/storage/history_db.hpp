#pragma once

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id = 0;
    std::string timestamp;   // set by the database
    std::string app;         // meeting app detected when recording began
    std::string outcome;     // complete / partial / failed / start_failed
    double recording_duration = 0.0;
    int64_t segment_count = 0;
    std::string combined_path;
    std::string summary_path;
    std::string error;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // id and timestamp of `entry` are ignored.
    bool insert(const HistoryEntry& entry);

    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
