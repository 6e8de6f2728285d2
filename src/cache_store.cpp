#include "cache_store.h"
#include <sqlite3.h>
#include <ctime>
#include <iostream>
#include <stdexcept>

namespace {

// Opens the cache DB; nullptr after logging on failure.
sqlite3 *open_db(const std::string &path)
{
    sqlite3 *db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK)
    {
        std::cerr << "[Cache] Failed to open " << path << ": "
                  << (db ? sqlite3_errmsg(db) : "out of memory") << "\n";
        sqlite3_close(db);
        return nullptr;
    }
    // weather worker and main thread may write at the same time
    sqlite3_busy_timeout(db, 500);
    return db;
}

} // namespace

long long wall_clock_seconds()
{
    return static_cast<long long>(std::time(nullptr));
}

bool cache_fresh(long long updated_at, long long ttl_s, long long now_s)
{
    long long age = now_s - updated_at;
    return age >= 0 && age < ttl_s;
}

CacheStore::CacheStore(const std::string &path)
    : db_path_(path) {}

void CacheStore::ensure_schema()
{
    sqlite3 *db = nullptr;
    if (sqlite3_open(db_path_.c_str(), &db) != SQLITE_OK)
    {
        sqlite3_close(db);
        throw std::runtime_error("Failed to open SQLite DB: " + db_path_);
    }

    const char *sql =
        "CREATE TABLE IF NOT EXISTS cache ("
        " key TEXT PRIMARY KEY,"
        " value TEXT NOT NULL,"
        " updated_at INTEGER NOT NULL)";

    char *errmsg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &errmsg) != SQLITE_OK)
    {
        std::string msg = errmsg ? errmsg : "";
        sqlite3_free(errmsg);
        sqlite3_close(db);
        throw std::runtime_error("Failed to create cache table: " + msg);
    }
    sqlite3_close(db);
}

bool CacheStore::get(const std::string &key, std::string &value, long long &updated_at)
{
    sqlite3 *db = open_db(db_path_);
    if (!db)
        return false;

    const char *sql = "SELECT value, updated_at FROM cache WHERE key = ?";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        std::cerr << "[Cache] prepare select failed: " << sqlite3_errmsg(db) << "\n";
        sqlite3_close(db);
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    bool found = false;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        const unsigned char *text = sqlite3_column_text(stmt, 0);
        value = text ? reinterpret_cast<const char *>(text) : "";
        updated_at = sqlite3_column_int64(stmt, 1);
        found = true;
    }

    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return found;
}

bool CacheStore::put(const std::string &key, const std::string &value, long long updated_at)
{
    sqlite3 *db = open_db(db_path_);
    if (!db)
        return false;

    const char *sql =
        "INSERT OR REPLACE INTO cache (key, value, updated_at) VALUES (?, ?, ?)";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        std::cerr << "[Cache] prepare insert failed: " << sqlite3_errmsg(db) << "\n";
        sqlite3_close(db);
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, updated_at);

    bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    if (!ok)
    {
        std::cerr << "[Cache] insert " << key << " failed: " << sqlite3_errmsg(db) << "\n";
    }

    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return ok;
}
