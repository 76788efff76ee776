#include "storage/history_db.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr int kSchemaVersion = 1;

constexpr const char* kSchema = R"(
    CREATE TABLE IF NOT EXISTS sessions (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
        text TEXT NOT NULL,
        audio_duration REAL,
        processing_time REAL,
        confidence REAL,
        delivery TEXT,
        backend TEXT,
        language TEXT
    );
    CREATE INDEX IF NOT EXISTS sessions_timestamp ON sessions(timestamp);
)";

void finalize(sqlite3_stmt*& stmt) {
    if (stmt) {
        sqlite3_finalize(stmt);
        stmt = nullptr;
    }
}

} // namespace

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

std::expected<void, std::string> HistoryDb::open(const std::string& path,
                                                 uint32_t retention_days) {
    close();
    retention_days_ = retention_days;

    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        auto err = std::format("cannot open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return std::unexpected(err);
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (auto res = migrate(); !res) {
        close();
        return res;
    }

    const struct {
        const char* sql;
        sqlite3_stmt** stmt;
    } statements[] = {
        {"INSERT INTO sessions (text, audio_duration, processing_time, confidence, "
         "delivery, backend, language) VALUES (?, ?, ?, ?, ?, ?, ?)",
         &insert_stmt_},
        {"SELECT id, timestamp, text, audio_duration, processing_time, confidence, "
         "delivery, backend, language FROM sessions ORDER BY id DESC LIMIT ?",
         &recent_stmt_},
        {"DELETE FROM sessions WHERE timestamp < strftime('%Y-%m-%dT%H:%M:%f','now',?)",
         &prune_stmt_},
        {"DELETE FROM sessions", &clear_stmt_},
    };
    for (const auto& s : statements) {
        if (sqlite3_prepare_v2(db_, s.sql, -1, s.stmt, nullptr) != SQLITE_OK) {
            auto err = error("prepare");
            close();
            return std::unexpected(err);
        }
    }

    if (auto pruned = prune(); !pruned) {
        std::println(stderr, "db: {}", pruned.error());
    }
    return {};
}

void HistoryDb::close() {
    finalize(insert_stmt_);
    finalize(recent_stmt_);
    finalize(prune_stmt_);
    finalize(clear_stmt_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::expected<void, std::string> HistoryDb::migrate() {
    int version = 0;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "PRAGMA user_version", -1, &stmt, nullptr) != SQLITE_OK) {
        return std::unexpected(error("read schema version"));
    }
    if (sqlite3_step(stmt) == SQLITE_ROW) version = sqlite3_column_int(stmt, 0);
    sqlite3_finalize(stmt);

    if (version > kSchemaVersion) {
        return std::unexpected(std::format("history schema {} is newer than supported {}",
                                           version, kSchemaVersion));
    }
    if (version == kSchemaVersion) return {};

    char* msg = nullptr;
    if (sqlite3_exec(db_, kSchema, nullptr, nullptr, &msg) != SQLITE_OK) {
        auto err = std::format("create schema: {}", msg ? msg : "unknown");
        sqlite3_free(msg);
        return std::unexpected(err);
    }
    auto pragma = std::format("PRAGMA user_version = {}", kSchemaVersion);
    if (sqlite3_exec(db_, pragma.c_str(), nullptr, nullptr, nullptr) != SQLITE_OK) {
        return std::unexpected(error("set schema version"));
    }
    return {};
}

std::expected<int64_t, std::string> HistoryDb::insert(const HistoryRecord& rec) {
    if (!insert_stmt_) return std::unexpected("history is not open");

    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);

    // Empty strings are stored as NULL.
    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    sqlite3_bind_text(insert_stmt_, 1, rec.text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insert_stmt_, 2, rec.audio_duration);
    sqlite3_bind_double(insert_stmt_, 3, rec.processing_time);
    sqlite3_bind_double(insert_stmt_, 4, rec.confidence);
    bind_nullable(5, rec.delivery);
    bind_nullable(6, rec.backend);
    bind_nullable(7, rec.language);

    if (sqlite3_step(insert_stmt_) != SQLITE_DONE) {
        return std::unexpected(error("insert"));
    }
    int64_t id = sqlite3_last_insert_rowid(db_);

    if (auto pruned = prune(); !pruned) {
        std::println(stderr, "db: {}", pruned.error());
    }
    return id;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        HistoryEntry e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = get_text(recent_stmt_, 1);
        e.record.text = get_text(recent_stmt_, 2);
        e.record.audio_duration = sqlite3_column_double(recent_stmt_, 3);
        e.record.processing_time = sqlite3_column_double(recent_stmt_, 4);
        e.record.confidence = sqlite3_column_double(recent_stmt_, 5);
        e.record.delivery = get_text(recent_stmt_, 6);
        e.record.backend = get_text(recent_stmt_, 7);
        e.record.language = get_text(recent_stmt_, 8);
        entries.push_back(std::move(e));
    }
    return entries;
}

int64_t HistoryDb::count() {
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM sessions", -1, &stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: {}", error("count"));
        return 0;
    }
    int64_t n = sqlite3_step(stmt) == SQLITE_ROW ? sqlite3_column_int64(stmt, 0) : 0;
    sqlite3_finalize(stmt);
    return n;
}

std::expected<int, std::string> HistoryDb::prune() {
    if (!prune_stmt_) return std::unexpected("history is not open");
    if (retention_days_ == 0) return 0;

    auto window = std::format("-{} days", retention_days_);
    sqlite3_reset(prune_stmt_);
    sqlite3_bind_text(prune_stmt_, 1, window.c_str(), -1, SQLITE_TRANSIENT);
    return run_delete(prune_stmt_);
}

std::expected<int, std::string> HistoryDb::clear() {
    if (!clear_stmt_) return std::unexpected("history is not open");
    sqlite3_reset(clear_stmt_);
    return run_delete(clear_stmt_);
}

std::expected<int, std::string> HistoryDb::run_delete(sqlite3_stmt* stmt) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        return std::unexpected(error("delete"));
    }
    return sqlite3_changes(db_);
}

std::string HistoryDb::error(const char* what) const {
    return std::format("{} failed: {}", what, db_ ? sqlite3_errmsg(db_) : "no database");
}
