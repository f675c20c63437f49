#include "adapters/sqlite_database_adapter.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

namespace {

struct DatabaseCloser {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
};
struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using DatabaseHandle = std::unique_ptr<sqlite3, DatabaseCloser>;
using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

DatabaseHandle openDatabase(const std::string& path, int flags, std::string& error) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    DatabaseHandle db(raw);
    if (rc != SQLITE_OK) {
        error = "Cannot open database " + path + ": " + (raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc));
        return nullptr;
    }
    sqlite3_busy_timeout(db.get(), 5000);
    return db;
}

Statement prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return nullptr;
    }
    return Statement(raw);
}

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// Escapes LIKE wildcards so a mapping prefix matches literally.
std::string likePrefix(const std::string& prefix) {
    std::string pattern;
    for (char c : prefix) {
        if (c == '%' || c == '_' || c == '\\') {
            pattern += '\\';
        }
        pattern += c;
    }
    return pattern + "%";
}

bool execute(sqlite3* db, const char* sql, std::string& error) {
    char* message = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &message) != SQLITE_OK) {
        error = message ? message : "unknown SQLite error";
        sqlite3_free(message);
        return false;
    }
    return true;
}

} // namespace

IntegrityResult SqliteDatabaseAdapter::checkIntegrity(const std::string& dbPath) {
    IntegrityResult result;
    if (!fs::exists(dbPath)) {
        result.detail = "database not found: " + dbPath;
        return result;
    }

    DatabaseHandle db = openDatabase(dbPath, SQLITE_OPEN_READONLY, lastError_);
    if (!db) {
        result.detail = lastError_;
        return result;
    }

    Statement stmt = prepare(db.get(), "PRAGMA integrity_check");
    if (!stmt) {
        result.detail = std::string("error: ") + sqlite3_errmsg(db.get());
        return result;
    }

    std::string detail;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        if (!detail.empty()) {
            detail += "; ";
        }
        detail += columnText(stmt.get(), 0);
    }
    if (rc != SQLITE_DONE) {
        result.detail = std::string("error: ") + sqlite3_errmsg(db.get());
        return result;
    }

    result.ok = (detail == "ok");
    result.detail = detail;
    return result;
}

bool SqliteDatabaseAdapter::remapPaths(const std::string& dbPath,
                                       const std::map<std::string, std::string>& mapping) {
    lastError_.clear();
    if (!fs::exists(dbPath)) {
        lastError_ = "Database not found: " + dbPath;
        return false;
    }

    std::string backupPath = dbPath + kBackupSuffix;
    std::error_code ec;
    fs::copy_file(dbPath, backupPath, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        lastError_ = "Failed to back up database before remapping: " + ec.message();
        return false;
    }

    bool success = false;
    {
        DatabaseHandle db = openDatabase(dbPath, SQLITE_OPEN_READWRITE, lastError_);
        if (db && execute(db.get(), "BEGIN IMMEDIATE", lastError_)) {
            static const char* statements[] = {
                "UPDATE section_locations SET root_path = REPLACE(root_path, ?1, ?2) "
                "WHERE root_path LIKE ?3 ESCAPE '\\'",
                "UPDATE media_parts SET file = REPLACE(file, ?1, ?2) "
                "WHERE file LIKE ?3 ESCAPE '\\'"
            };

            success = true;
            int changed = 0;
            for (const char* sql : statements) {
                Statement stmt = prepare(db.get(), sql);
                if (!stmt) {
                    lastError_ = std::string("Remap failed: ") + sqlite3_errmsg(db.get());
                    success = false;
                    break;
                }
                for (const auto& [oldPrefix, newPrefix] : mapping) {
                    std::string pattern = likePrefix(oldPrefix);
                    sqlite3_reset(stmt.get());
                    sqlite3_bind_text(stmt.get(), 1, oldPrefix.c_str(), -1, SQLITE_TRANSIENT);
                    sqlite3_bind_text(stmt.get(), 2, newPrefix.c_str(), -1, SQLITE_TRANSIENT);
                    sqlite3_bind_text(stmt.get(), 3, pattern.c_str(), -1, SQLITE_TRANSIENT);
                    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                        lastError_ = std::string("Remap failed: ") + sqlite3_errmsg(db.get());
                        success = false;
                        break;
                    }
                    changed += sqlite3_changes(db.get());
                }
                if (!success) {
                    break;
                }
            }

            if (success) {
                success = execute(db.get(), "COMMIT", lastError_);
                if (success) {
                    Logger::info("Remapped " + std::to_string(changed) + " database paths in " + dbPath);
                }
            } else {
                std::string ignored;
                execute(db.get(), "ROLLBACK", ignored);
            }
        }
    }

    if (!success) {
        Logger::error("Path remapping failed, restoring " + backupPath + ": " + lastError_);
        fs::copy_file(backupPath, dbPath, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            lastError_ += "; restoring the pre-write copy failed: " + ec.message();
        }
    }
    return success;
}

bool SqliteDatabaseAdapter::exportSummary(const std::string& dbPath, const std::string& outputFile) {
    lastError_.clear();
    DatabaseHandle db = openDatabase(dbPath, SQLITE_OPEN_READONLY, lastError_);
    if (!db) {
        return false;
    }

    nlohmann::json info;
    info["sections"] = nlohmann::json::array();
    info["locations"] = nlohmann::json::array();

    // Missing tables just leave their part of the summary empty
    if (Statement stmt = prepare(db.get(), "SELECT id, name, section_type FROM library_sections")) {
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            info["sections"].push_back({
                {"id", sqlite3_column_int64(stmt.get(), 0)},
                {"name", columnText(stmt.get(), 1)},
                {"type", sqlite3_column_int(stmt.get(), 2)}
            });
        }
    }

    if (Statement stmt = prepare(db.get(), "SELECT id, library_section_id, root_path FROM section_locations")) {
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            info["locations"].push_back({
                {"id", sqlite3_column_int64(stmt.get(), 0)},
                {"library_section_id", sqlite3_column_int64(stmt.get(), 1)},
                {"root_path", columnText(stmt.get(), 2)}
            });
        }
    }

    int64_t items = 0;
    if (Statement stmt = prepare(db.get(), "SELECT COUNT(*) FROM metadata_items")) {
        if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            items = sqlite3_column_int64(stmt.get(), 0);
        }
    }

    std::error_code ec;
    info["stats"] = {
        {"main_db_size", static_cast<int64_t>(fs::file_size(dbPath, ec))},
        {"total_libraries", info["sections"].size()},
        {"total_items", items}
    };

    std::ofstream out(outputFile);
    if (!out.is_open()) {
        lastError_ = "Cannot write summary to " + outputFile;
        return false;
    }
    out << info.dump(2);
    return out.good();
}
