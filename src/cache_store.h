#pragma once
#include <string>

// Small persistent key/value cache (SQLite) for values that are slow or
// privileged to obtain: RAM vendor, disk model, last weather report.
//
//   CREATE TABLE cache (key TEXT PRIMARY KEY, value TEXT, updated_at INTEGER)
//
// updated_at is wall-clock seconds since the epoch.
class CacheStore {
public:
    explicit CacheStore(const std::string &path);

    // Creates the table. Throws std::runtime_error if the DB can't be opened.
    void ensure_schema();

    bool get(const std::string &key, std::string &value, long long &updated_at);
    bool put(const std::string &key, const std::string &value, long long updated_at);

    const std::string &path() const { return db_path_; }

private:
    std::string db_path_;
};

long long wall_clock_seconds();

// True when an entry written at `updated_at` is younger than `ttl_s` at `now_s`.
bool cache_fresh(long long updated_at, long long ttl_s, long long now_s);
