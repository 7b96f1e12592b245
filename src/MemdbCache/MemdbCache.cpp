#include "MemdbCache.hpp"
#include "CacheKey.hpp"
#include "Logger.hpp"
#include <stdexcept>
#include <utility>

static const char* kMemdbSchema =
    "CREATE TABLE IF NOT EXISTS vcache ("
    "  k      TEXT PRIMARY KEY,"
    "  expire INTEGER NOT NULL DEFAULT 0,"
    "  value  TEXT NOT NULL"
    ");";

static const char* kMemdbUpsert =
    "INSERT INTO vcache (k, expire, value) VALUES (?, ?, ?) "
    "ON CONFLICT(k) DO UPDATE SET expire = excluded.expire, value = excluded.value;";

bool MemdbCache::supported() {
    return sqlite3_vfs_find("memdb") != nullptr;
}

// Desc: open the shared in-memory database and apply the size limit
// In: std::uint64_t max_bytes, const std::string& name, NowFn now
// Out: throws std::runtime_error on open/schema failure
MemdbCache::MemdbCache(std::uint64_t max_bytes, const std::string& name, NowFn now)
    : now_(std::move(now)) {
    const std::string uri = "file:" + name + "?vfs=memdb";
    int rc = sqlite3_open_v2(uri.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI, nullptr);
    if (rc != SQLITE_OK) {
        const std::string msg = std::string("memdb open failed: ") + (db_ ? sqlite3_errmsg(db_) : "unknown");
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error(msg);
    }
    sqlite3_busy_timeout(db_, 1000);
    if (!exec(kMemdbSchema)) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("memdb schema failed");
    }
    if (max_bytes > 0) {
        const std::int64_t page_size = pragma_int("PRAGMA page_size;");
        if (page_size > 0) {
            const std::string sql = "PRAGMA max_page_count = "
                + std::to_string(static_cast<std::int64_t>(max_bytes) / page_size) + ";";
            (void)exec(sql.c_str());
        }
    }
}

MemdbCache::~MemdbCache() {
    if (db_) sqlite3_close(db_);
}

bool MemdbCache::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        Logger::error("MemdbCache", std::string(sql) + " failed: " + (err ? err : "unknown"));
        if (err) sqlite3_free(err);
        return false;
    }
    return true;
}

std::int64_t MemdbCache::pragma_int(const char* sql) {
    std::int64_t v = -1;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) v = sqlite3_column_int64(stmt, 0);
        (void)sqlite3_finalize(stmt);
    }
    return v;
}

bool MemdbCache::clear(const std::string& realm) {
    if (realm.empty()) return exec("DELETE FROM vcache;");

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM vcache WHERE substr(k, 1, length(?1)) = ?1;",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("MemdbCache", std::string("clear prepare failed: ") + sqlite3_errmsg(db_));
        return false;
    }
    const std::string prefix = realm_prefix(realm);
    sqlite3_bind_text(stmt, 1, prefix.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    (void)sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

bool MemdbCache::exists(const std::string& id, const std::string& realm) {
    return get(id, realm).has_value();
}

CacheResult MemdbCache::get(const std::string& id, const std::string& realm) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT value FROM vcache WHERE k = ? AND (expire = 0 OR expire > ?);",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("MemdbCache", std::string("lookup prepare failed: ") + sqlite3_errmsg(db_));
        return std::nullopt;
    }
    const std::string key = flat_key(id, realm);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(now_()));

    CacheResult res;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* t = sqlite3_column_text(stmt, 0);
        res = parse_value(t ? reinterpret_cast<const char*>(t) : "");
    }
    (void)sqlite3_finalize(stmt);
    return res;
}

bool MemdbCache::remove(const std::string& id, const std::string& realm) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM vcache WHERE k = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("MemdbCache", std::string("delete prepare failed: ") + sqlite3_errmsg(db_));
        return false;
    }
    const std::string key = flat_key(id, realm);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    (void)sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(db_) == 1;
}

// Desc: upsert one entry; when the size limit is hit, expired rows are
//       purged and the write retried once
// In: const std::string& id, const CacheValue& data, const std::string& realm, std::int64_t ttl
// Out: bool (true on success)
bool MemdbCache::store(const std::string& id, const CacheValue& data,
                       const std::string& realm, std::int64_t ttl) {
    const std::string key = flat_key(id, realm);
    const std::string raw = serialize_value(data);
    const std::int64_t expire = ttl > 0 ? now_() + ttl : 0;

    for (int attempt = 0; attempt < 2; ++attempt) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, kMemdbUpsert, -1, &stmt, nullptr) != SQLITE_OK) {
            Logger::error("MemdbCache", std::string("upsert prepare failed: ") + sqlite3_errmsg(db_));
            return false;
        }
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(expire));
        sqlite3_bind_text(stmt, 3, raw.c_str(), static_cast<int>(raw.size()), SQLITE_TRANSIENT);
        const int rc = sqlite3_step(stmt);
        (void)sqlite3_finalize(stmt);
        if (rc == SQLITE_DONE) return true;
        if (rc != SQLITE_FULL || attempt > 0) break;

        sqlite3_stmt* gc = nullptr;
        if (sqlite3_prepare_v2(db_, "DELETE FROM vcache WHERE expire > 0 AND expire <= ?;",
                               -1, &gc, nullptr) != SQLITE_OK) break;
        sqlite3_bind_int64(gc, 1, static_cast<sqlite3_int64>(now_()));
        (void)sqlite3_step(gc);
        (void)sqlite3_finalize(gc);
    }
    Logger::error("MemdbCache", "store " + key + " failed: " + sqlite3_errmsg(db_));
    return false;
}

// Desc: read-modify-write inside one immediate transaction
// In: const std::string& key, std::int64_t delta
// Out: std::int64_t (new value)
std::int64_t MemdbCache::add(const std::string& key, std::int64_t delta) {
    if (!exec("BEGIN IMMEDIATE;")) return 0;

    std::int64_t cur = 0;
    std::int64_t expire = 0;
    sqlite3_stmt* sel = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT value, expire FROM vcache WHERE k = ? AND (expire = 0 OR expire > ?);",
                           -1, &sel, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(sel, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(sel, 2, static_cast<sqlite3_int64>(now_()));
        if (sqlite3_step(sel) == SQLITE_ROW) {
            const unsigned char* t = sqlite3_column_text(sel, 0);
            cur = counter_value(parse_value(t ? reinterpret_cast<const char*>(t) : ""));
            expire = sqlite3_column_int64(sel, 1);
        }
        (void)sqlite3_finalize(sel);
    }

    const std::int64_t res = cur + delta;
    const std::string raw = serialize_value(CacheValue(res));
    bool ok = false;
    sqlite3_stmt* up = nullptr;
    if (sqlite3_prepare_v2(db_, kMemdbUpsert, -1, &up, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(up, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(up, 2, static_cast<sqlite3_int64>(expire));
        sqlite3_bind_text(up, 3, raw.c_str(), -1, SQLITE_TRANSIENT);
        ok = sqlite3_step(up) == SQLITE_DONE;
        (void)sqlite3_finalize(up);
    }
    if (!ok) {
        Logger::error("MemdbCache", "counter " + key + " failed: " + sqlite3_errmsg(db_));
        (void)exec("ROLLBACK;");
        return cur;
    }
    if (!exec("COMMIT;")) {
        (void)exec("ROLLBACK;");
        return cur;
    }
    return res;
}

std::int64_t MemdbCache::inc(const std::string& id, const std::string& realm, std::int64_t delta) {
    return add(flat_key(id, realm), delta);
}

std::int64_t MemdbCache::dec(const std::string& id, const std::string& realm, std::int64_t delta) {
    return add(flat_key(id, realm), -delta);
}

// Desc: usage from page counts; max follows the configured limit
// In: (none)
// Out: UsageInfo
UsageInfo MemdbCache::get_info() {
    UsageInfo info;
    const std::int64_t page_size = pragma_int("PRAGMA page_size;");
    const std::int64_t pages     = pragma_int("PRAGMA page_count;");
    const std::int64_t max_pages = pragma_int("PRAGMA max_page_count;");
    if (page_size <= 0) return info;
    if (pages >= 0) info.occupied = pages * page_size;
    if (max_pages > 0) info.max = max_pages * page_size;
    if (info.max >= 0 && info.occupied >= 0) info.available = info.max - info.occupied;
    return info;
}
