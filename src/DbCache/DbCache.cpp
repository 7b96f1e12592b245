#include "DbCache.hpp"
#include "Logger.hpp"
#include <iostream>

static const char* kUpsertSql =
    "INSERT INTO cache (c_name, c_realm, c_expire, c_auto, c_value) "
    "VALUES (?, ?, ?, ?, ?) "
    "ON CONFLICT(c_name, c_realm) DO UPDATE SET "
    "c_value = excluded.c_value, c_expire = excluded.c_expire, c_auto = excluded.c_auto;";

static const char* kDeleteSql =
    "DELETE FROM cache WHERE c_realm = ? AND c_name = ?;";

DbCache::DbCache(sqlite3* db, NowFn now) : db_(db), now_(std::move(now)) {
    const int removed = gc();
    #ifdef DEBUG
    std::cout << "[DbCache] gc removed " << removed << " expired rows" << std::endl;
    #else
    (void)removed;
    #endif
}

// Desc: run a statement without bindings, logging failure
// In: const char* sql
// Out: bool (true on SQLITE_OK)
bool DbCache::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        Logger::error("DbCache", std::string(sql) + " failed: " + (err ? err : "unknown"));
        if (err) sqlite3_free(err);
        return false;
    }
    return true;
}

// Desc: commit the open transaction, rolling back if the commit fails
// In: (none)
// Out: bool (true if committed)
bool DbCache::commit() {
    if (exec("COMMIT;")) return true;
    (void)exec("ROLLBACK;");
    buffer_.clear();
    return false;
}

// Desc: delete rows whose expiration instant has passed
// In: (none)
// Out: int (rows removed, -1 on error)
int DbCache::gc() {
    if (!db_) return -1;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM cache WHERE c_expire > 0 AND c_expire <= ?;",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("DbCache", std::string("gc prepare failed: ") + sqlite3_errmsg(db_));
        return -1;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(now_()));
    const int rc = sqlite3_step(stmt);
    (void)sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        Logger::error("DbCache", std::string("gc failed: ") + sqlite3_errmsg(db_));
        return -1;
    }
    return sqlite3_changes(db_);
}

bool DbCache::clear(const std::string& realm) {
    if (!db_) return false;
    if (realm.empty()) {
        buffer_.clear();
        return exec("DELETE FROM cache;");
    }

    for (auto it = buffer_.begin(); it != buffer_.end();) {
        if (it->first.first == realm) it = buffer_.erase(it);
        else ++it;
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM cache WHERE c_realm = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("DbCache", std::string("clear prepare failed: ") + sqlite3_errmsg(db_));
        return false;
    }
    sqlite3_bind_text(stmt, 1, realm.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    (void)sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

// Desc: point lookup of a live row; a hit is kept in the read buffer
// In: const std::string& id, const std::string& realm
// Out: bool (true if found)
bool DbCache::fetch(const std::string& id, const std::string& realm) {
    if (!db_) return false;
    const char* sql =
        "SELECT c_value, c_expire FROM cache "
        "WHERE c_realm = ? AND c_name = ? AND (c_expire = 0 OR c_expire > ?);";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("DbCache", std::string("lookup prepare failed: ") + sqlite3_errmsg(db_));
        return false;
    }
    sqlite3_bind_text(stmt, 1, realm.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(now_()));

    bool found = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* t = sqlite3_column_text(stmt, 0);
        const std::string raw = t ? reinterpret_cast<const char*>(t) : "";
        CacheResult v = parse_value(raw);
        if (v) {
            buffer_[Key(realm, id)] = Buffered{*v, sqlite3_column_int64(stmt, 1)};
            found = true;
        } else {
            Logger::error("DbCache", "corrupt value for " + realm + "/" + id);
        }
    }
    (void)sqlite3_finalize(stmt);
    if (!found) buffer_.erase(Key(realm, id));
    return found;
}

bool DbCache::exists(const std::string& id, const std::string& realm) {
    return fetch(id, realm);
}

// Desc: buffered value if still live, else query the table
// In: const std::string& id, const std::string& realm
// Out: CacheResult (empty if absent or expired)
CacheResult DbCache::get(const std::string& id, const std::string& realm) {
    auto it = buffer_.find(Key(realm, id));
    if (it != buffer_.end()) {
        if (it->second.expire == 0 || it->second.expire > now_()) return it->second.value;
        buffer_.erase(it);
    }
    if (!fetch(id, realm)) return std::nullopt;
    return buffer_[Key(realm, id)].value;
}

bool DbCache::remove(const std::string& id, const std::string& realm) {
    if (!db_) return false;
    buffer_.erase(Key(realm, id));

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, kDeleteSql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("DbCache", std::string("delete prepare failed: ") + sqlite3_errmsg(db_));
        return false;
    }
    sqlite3_bind_text(stmt, 1, realm.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    (void)sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(db_) == 1;
}

// Desc: bind one entry to the prepared upsert and run it
// In: sqlite3_stmt* stmt, const PendingStore& e
// Out: bool (true on SQLITE_DONE)
bool DbCache::upsert(sqlite3_stmt* stmt, const PendingStore& e) {
    const std::string raw = serialize_value(e.data);
    sqlite3_bind_text(stmt, 1, e.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, e.realm.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(e.expire));
    sqlite3_bind_int(stmt, 4, e.autoload ? 1 : 0);
    sqlite3_bind_text(stmt, 5, raw.c_str(), static_cast<int>(raw.size()), SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        Logger::error("DbCache", "upsert " + e.realm + "/" + e.id + " failed: " + sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool DbCache::store(const std::string& id, const CacheValue& data,
                    const std::string& realm, std::int64_t ttl) {
    return store(id, data, realm, ttl, true);
}

// Desc: upsert one row immediately
// In: const std::string& id, const CacheValue& data, const std::string& realm, std::int64_t ttl, bool autoload
// Out: bool (true on success)
bool DbCache::store(const std::string& id, const CacheValue& data,
                    const std::string& realm, std::int64_t ttl, bool autoload) {
    if (!db_) return false;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, kUpsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("DbCache", std::string("upsert prepare failed: ") + sqlite3_errmsg(db_));
        return false;
    }
    const PendingStore e{id, data, realm, expire_at(ttl), autoload};
    const bool ok = upsert(stmt, e);
    (void)sqlite3_finalize(stmt);
    if (!ok) {
        buffer_.erase(Key(realm, id));
        return false;
    }
    buffer_[Key(realm, id)] = Buffered{data, e.expire};
    return true;
}

// Desc: delete all keys in one transaction
// In: const std::vector<EntryKey>& keys
// Out: bool (false if any delete failed; the transaction is rolled back)
bool DbCache::remove_batch(const std::vector<EntryKey>& keys) {
    if (!db_) return false;
    if (keys.empty()) return true;
    if (!exec("BEGIN IMMEDIATE;")) return false;

    sqlite3_stmt* del = nullptr;
    if (sqlite3_prepare_v2(db_, kDeleteSql, -1, &del, nullptr) != SQLITE_OK) {
        Logger::error("DbCache", std::string("batch delete prepare failed: ") + sqlite3_errmsg(db_));
        (void)exec("ROLLBACK;");
        return false;
    }
    bool ok = true;
    for (const auto& k : keys) {
        buffer_.erase(Key(k.realm, k.id));
        sqlite3_bind_text(del, 1, k.realm.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(del, 2, k.id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(del) != SQLITE_DONE) {
            Logger::error("DbCache", "batch delete " + k.realm + "/" + k.id + " failed: " + sqlite3_errmsg(db_));
            ok = false;
            break;
        }
        (void)sqlite3_reset(del);
        (void)sqlite3_clear_bindings(del);
    }
    (void)sqlite3_finalize(del);
    if (!ok) {
        (void)exec("ROLLBACK;");
        return false;
    }
    return commit();
}

// Desc: upsert all entries in one transaction; later entries win over earlier ones.
//       Expiration instants are written as given.
// In: const std::vector<PendingStore>& entries
// Out: bool (false if any upsert failed; the transaction is rolled back)
bool DbCache::store_batch(const std::vector<PendingStore>& entries) {
    if (!db_) return false;
    if (entries.empty()) return true;
    if (!exec("BEGIN IMMEDIATE;")) return false;

    sqlite3_stmt* ins = nullptr;
    if (sqlite3_prepare_v2(db_, kUpsertSql, -1, &ins, nullptr) != SQLITE_OK) {
        Logger::error("DbCache", std::string("batch upsert prepare failed: ") + sqlite3_errmsg(db_));
        (void)exec("ROLLBACK;");
        return false;
    }
    bool ok = true;
    for (const auto& e : entries) {
        if (!upsert(ins, e)) {
            ok = false;
            break;
        }
        (void)sqlite3_reset(ins);
        (void)sqlite3_clear_bindings(ins);
        buffer_[Key(e.realm, e.id)] = Buffered{e.data, e.expire};
    }
    (void)sqlite3_finalize(ins);
    if (!ok) {
        (void)exec("ROLLBACK;");
        buffer_.clear();
        return false;
    }
    return commit();
}

// Desc: load every live autoload row of the given realms
// In: const std::vector<std::string>& realms, std::map<std::string, CacheValue>& out
// Out: std::size_t (rows loaded)
std::size_t DbCache::get_all(const std::vector<std::string>& realms,
                             std::map<std::string, CacheValue>& out) {
    if (!db_ || realms.empty()) return 0;

    std::string sql =
        "SELECT c_name, c_value FROM cache "
        "WHERE c_auto = 1 AND (c_expire = 0 OR c_expire > ?) AND c_realm IN (";
    for (std::size_t i = 0; i < realms.size(); ++i) sql += (i == 0 ? "?" : ",?");
    sql += ");";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::error("DbCache", std::string("get_all prepare failed: ") + sqlite3_errmsg(db_));
        return 0;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(now_()));
    for (std::size_t i = 0; i < realms.size(); ++i) {
        sqlite3_bind_text(stmt, static_cast<int>(i + 2), realms[i].c_str(), -1, SQLITE_TRANSIENT);
    }

    std::size_t n = 0;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* name = sqlite3_column_text(stmt, 0);
        const unsigned char* val  = sqlite3_column_text(stmt, 1);
        if (!name) continue;
        CacheResult v = parse_value(val ? reinterpret_cast<const char*>(val) : "");
        if (!v) continue;
        out[reinterpret_cast<const char*>(name)] = *v;
        ++n;
    }
    (void)sqlite3_finalize(stmt);
    return n;
}

std::int64_t DbCache::pragma_int(const char* sql) {
    std::int64_t v = -1;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) v = sqlite3_column_int64(stmt, 0);
        (void)sqlite3_finalize(stmt);
    }
    return v;
}

// Desc: database file usage from page counts
// In: (none)
// Out: UsageInfo
UsageInfo DbCache::get_info() {
    UsageInfo info;
    if (!db_) return info;
    const std::int64_t page_size = pragma_int("PRAGMA page_size;");
    const std::int64_t pages     = pragma_int("PRAGMA page_count;");
    const std::int64_t max_pages = pragma_int("PRAGMA max_page_count;");
    if (page_size <= 0) return info;
    if (pages >= 0) info.occupied = pages * page_size;
    if (max_pages > 0) info.max = max_pages * page_size;
    if (info.max >= 0 && info.occupied >= 0) info.available = info.max - info.occupied;
    return info;
}
