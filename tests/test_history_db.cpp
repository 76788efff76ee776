#include <catch2/catch_test_macros.hpp>

#include "storage/history_db.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = (std::filesystem::temp_directory_path() /
                ("ht_test_db_" + std::to_string(getpid()) + ".sqlite")).string();
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

// Rewrites every row's timestamp, bypassing HistoryDb.
void age_all_rows(const std::string& path, int days) {
    sqlite3* raw = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &raw) == SQLITE_OK);
    auto sql = "UPDATE sessions SET timestamp = strftime('%Y-%m-%dT%H:%M:%f','now','-" +
               std::to_string(days) + " days')";
    REQUIRE(sqlite3_exec(raw, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(raw);
}

HistoryRecord record(std::string text) {
    return HistoryRecord{
        .text = std::move(text),
        .audio_duration = 1.0,
        .processing_time = 0.1,
        .confidence = 0.8,
        .delivery = "direct",
        .backend = "lan",
        .language = "en",
    };
}

} // namespace

TEST_CASE("HistoryDb", "[history]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("OpenCreatesParentDirectory") {
        auto dir = std::filesystem::temp_directory_path() /
                   ("ht_test_dir_" + std::to_string(getpid()));
        {
            HistoryDb db;
            REQUIRE(db.open((dir / "nested" / "history.db").string()));
        }
        REQUIRE(std::filesystem::exists(dir / "nested" / "history.db"));
        std::filesystem::remove_all(dir);
    }

    SECTION("InsertAndRetrieve") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(HistoryRecord{
            .text = "hello world",
            .audio_duration = 2.5,
            .processing_time = 0.3,
            .confidence = 0.92,
            .delivery = "clipboard",
            .backend = "lan",
            .language = "de",
        }));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        const auto& rec = entries[0].record;
        REQUIRE(rec.text == "hello world");
        REQUIRE(rec.audio_duration == 2.5);
        REQUIRE(rec.processing_time == 0.3);
        REQUIRE(rec.confidence == 0.92);
        REQUIRE(rec.delivery == "clipboard");
        REQUIRE(rec.backend == "lan");
        REQUIRE(rec.language == "de");
    }

    SECTION("LimitWorks") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        for (int i = 0; i < 5; ++i) {
            REQUIRE(db.insert(record("entry " + std::to_string(i))));
        }

        REQUIRE(db.recent(2).size() == 2);
        REQUIRE(db.recent(10).size() == 5);
    }

    SECTION("ReverseChronological") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(record("first")));
        REQUIRE(db.insert(record("second")));
        REQUIRE(db.insert(record("third")));

        auto entries = db.recent(3);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].record.text == "third");
        REQUIRE(entries[1].record.text == "second");
        REQUIRE(entries[2].record.text == "first");
        REQUIRE(entries[0].id > entries[2].id);
    }

    SECTION("NullableFields") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        // Empty strings are stored as NULL and come back empty
        REQUIRE(db.insert(HistoryRecord{.text = "test"}));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].record.delivery.empty());
        REQUIRE(entries[0].record.backend.empty());
        REQUIRE(entries[0].record.language.empty());
    }

    SECTION("TimestampAutoPopulated") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(record("test")));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }

    SECTION("SurvivesReopen") {
        TmpDb tmp;
        {
            HistoryDb db;
            REQUIRE(db.open(tmp.path));
            REQUIRE(db.insert(record("persisted")));
        }
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].record.text == "persisted");
    }

    SECTION("InsertReturnsRowId") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        auto first = db.insert(record("a"));
        auto second = db.insert(record("b"));
        REQUIRE(first);
        REQUIRE(second);
        REQUIRE(*second > *first);
        REQUIRE(db.recent(1)[0].id == *second);
    }

    SECTION("OpenPrunesExpiredEntries") {
        TmpDb tmp;
        {
            HistoryDb db;
            REQUIRE(db.open(tmp.path));
            REQUIRE(db.insert(record("old")));
        }
        age_all_rows(tmp.path, 10);

        HistoryDb db;
        REQUIRE(db.open(tmp.path, 7));
        REQUIRE(db.count() == 0);
    }

    SECTION("InsertPrunesExpiredEntries") {
        TmpDb tmp;
        {
            HistoryDb db;
            REQUIRE(db.open(tmp.path));
            REQUIRE(db.insert(record("old")));
            REQUIRE(db.insert(record("older")));
        }
        age_all_rows(tmp.path, 3);

        HistoryDb db;
        REQUIRE(db.open(tmp.path, 2));
        REQUIRE(db.insert(record("fresh")));
        auto entries = db.recent(10);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].record.text == "fresh");
    }

    SECTION("EntriesInsideWindowSurvive") {
        TmpDb tmp;
        {
            HistoryDb db;
            REQUIRE(db.open(tmp.path));
            REQUIRE(db.insert(record("recent")));
        }
        age_all_rows(tmp.path, 3);

        HistoryDb db;
        REQUIRE(db.open(tmp.path, 7));
        REQUIRE(db.count() == 1);
    }

    SECTION("ZeroRetentionKeepsEverything") {
        TmpDb tmp;
        {
            HistoryDb db;
            REQUIRE(db.open(tmp.path));
            REQUIRE(db.insert(record("ancient")));
        }
        age_all_rows(tmp.path, 3650);

        HistoryDb db;
        REQUIRE(db.open(tmp.path, 0));
        auto pruned = db.prune();
        REQUIRE(pruned);
        REQUIRE(*pruned == 0);
        REQUIRE(db.count() == 1);
    }

    SECTION("ClearRemovesEverything") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        for (int i = 0; i < 3; ++i) REQUIRE(db.insert(record("x")));

        auto removed = db.clear();
        REQUIRE(removed);
        REQUIRE(*removed == 3);
        REQUIRE(db.recent(10).empty());
    }

    SECTION("NewerSchemaIsRefused") {
        TmpDb tmp;
        {
            sqlite3* raw = nullptr;
            REQUIRE(sqlite3_open(tmp.path.c_str(), &raw) == SQLITE_OK);
            REQUIRE(sqlite3_exec(raw, "PRAGMA user_version = 99", nullptr, nullptr, nullptr) ==
                    SQLITE_OK);
            sqlite3_close(raw);
        }
        HistoryDb db;
        auto res = db.open(tmp.path);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().find("newer") != std::string::npos);
        REQUIRE_FALSE(db.is_open());
    }

    SECTION("ClosedDbRefusesWork") {
        HistoryDb db;
        REQUIRE_FALSE(db.is_open());
        REQUIRE_FALSE(db.insert(record("nowhere")));
        REQUIRE_FALSE(db.clear());
        REQUIRE(db.recent(5).empty());
        REQUIRE(db.count() == 0);
    }
}
