#include <gtest/gtest.h>
#include "adapters/sqlite_database_adapter.hpp"
#include "test_helpers.hpp"
#include <sqlite3.h>

namespace fs = std::filesystem;
using namespace testing_support;

namespace {

void runSql(const fs::path& dbPath, const std::string& sql) {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(dbPath.c_str(), &db), SQLITE_OK);
    char* error = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error);
    std::string message = error ? error : "";
    sqlite3_free(error);
    sqlite3_close(db);
    ASSERT_EQ(rc, SQLITE_OK) << message;
}

std::vector<std::string> column(const fs::path& dbPath, const std::string& sql) {
    std::vector<std::string> values;
    sqlite3* db = nullptr;
    if (sqlite3_open(dbPath.c_str(), &db) != SQLITE_OK) {
        sqlite3_close(db);
        return values;
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            values.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
        }
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return values;
}

} // namespace

class SqliteDatabaseAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dbPath_ = dir_.path() / "library.db";
        runSql(dbPath_,
               "CREATE TABLE library_sections (id INTEGER PRIMARY KEY, name TEXT, section_type INTEGER);"
               "CREATE TABLE section_locations (id INTEGER PRIMARY KEY, library_section_id INTEGER, root_path TEXT);"
               "INSERT INTO library_sections VALUES (1, 'Movies', 1);"
               "INSERT INTO section_locations VALUES (1, 1, '/old/media/movies');"
               "INSERT INTO section_locations VALUES (2, 1, '/other/place');");
    }

    TempDir dir_;
    fs::path dbPath_;
    SqliteDatabaseAdapter adapter_;
};

TEST_F(SqliteDatabaseAdapterTest, IntegrityOfHealthyDatabase) {
    IntegrityResult result = adapter_.checkIntegrity(dbPath_.string());
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.detail, "ok");

    EXPECT_FALSE(adapter_.checkIntegrity((dir_.path() / "absent.db").string()).ok);
}

TEST_F(SqliteDatabaseAdapterTest, RemapRewritesMatchingPrefixes) {
    runSql(dbPath_,
           "CREATE TABLE media_parts (id INTEGER PRIMARY KEY, file TEXT);"
           "INSERT INTO media_parts VALUES (1, '/old/media/movies/a.mkv');"
           "INSERT INTO media_parts VALUES (2, '/elsewhere/b.mkv');");

    ASSERT_TRUE(adapter_.remapPaths(dbPath_.string(), {{"/old/media", "/new/media"}})) << adapter_.getLastError();

    EXPECT_EQ(column(dbPath_, "SELECT root_path FROM section_locations ORDER BY id"),
              (std::vector<std::string>{"/new/media/movies", "/other/place"}));
    EXPECT_EQ(column(dbPath_, "SELECT file FROM media_parts ORDER BY id"),
              (std::vector<std::string>{"/new/media/movies/a.mkv", "/elsewhere/b.mkv"}));
    EXPECT_TRUE(fs::exists(dbPath_.string() + SqliteDatabaseAdapter::kBackupSuffix));
}

TEST_F(SqliteDatabaseAdapterTest, FailedRemapLeavesDatabaseAsItWas) {
    // No media_parts table, so the second statement fails
    EXPECT_FALSE(adapter_.remapPaths(dbPath_.string(), {{"/old/media", "/new/media"}}));
    EXPECT_FALSE(adapter_.getLastError().empty());

    EXPECT_EQ(column(dbPath_, "SELECT root_path FROM section_locations ORDER BY id"),
              (std::vector<std::string>{"/old/media/movies", "/other/place"}));
}

TEST_F(SqliteDatabaseAdapterTest, ExportSummaryListsSectionsAndLocations) {
    auto output = dir_.path() / "library_info.json";
    ASSERT_TRUE(adapter_.exportSummary(dbPath_.string(), output.string())) << adapter_.getLastError();

    auto summary = nlohmann::json::parse(readFile(output));
    ASSERT_EQ(summary["sections"].size(), 1u);
    EXPECT_EQ(summary["sections"][0]["name"], "Movies");
    EXPECT_EQ(summary["locations"].size(), 2u);
    EXPECT_EQ(summary["stats"]["total_libraries"], 1);
    EXPECT_EQ(summary["stats"]["total_items"], 0);
}
