#pragma once

#include <cstdint>
#include <expected>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryRecord {
    std::string text;
    double audio_duration = 0.0;
    double processing_time = 0.0;
    double confidence = 0.0;
    std::string delivery; // "direct" or "clipboard"
    std::string backend;
    std::string language;
};

struct HistoryEntry {
    int64_t id;
    std::string timestamp; // UTC, ISO 8601
    HistoryRecord record;
};

// Transcripts of completed sessions. Audio never reaches this table.
//
// With a retention window set, rows older than it are deleted when the
// database is opened and after every insert.
class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    // retention_days == 0 keeps everything.
    std::expected<void, std::string> open(const std::string& path, uint32_t retention_days = 0);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Row id of the new entry.
    std::expected<int64_t, std::string> insert(const HistoryRecord& rec);

    // Newest first.
    std::vector<HistoryEntry> recent(int limit = 10);

    int64_t count();

    // Both return the number of rows removed.
    std::expected<int, std::string> prune();
    std::expected<int, std::string> clear();

private:
    std::expected<void, std::string> migrate();
    std::expected<int, std::string> run_delete(sqlite3_stmt* stmt);
    std::string error(const char* what) const;

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* prune_stmt_ = nullptr;
    sqlite3_stmt* clear_stmt_ = nullptr;
    uint32_t retention_days_ = 0;
};
