#include "BindingRegistry.hpp"
#include "Logger.hpp"
#include <iostream>

static const char* kInsertSql =
    "INSERT INTO cache_bindings (c_event, c_id, c_realm, c_type) VALUES (?, ?, ?, ?);";

// Desc: c_type integer to TierType; false for values outside the enum
// In: int raw, TierType& out
// Out: bool
static bool tier_from_int(int raw, TierType& out) {
    if (raw < static_cast<int>(TierType::All) || raw > static_cast<int>(TierType::Memory)) return false;
    out = static_cast<TierType>(raw);
    return true;
}

// Desc: bind and step one prepared insert
// In: sqlite3_stmt* ins, const Binding& b
// Out: bool (true on SQLITE_DONE)
static bool insert_row(sqlite3_stmt* ins, const Binding& b) {
    sqlite3_bind_text(ins, 1, b.event.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(ins, 2, b.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(ins, 3, b.realm.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(ins, 4, static_cast<int>(b.tier));
    const int rc = sqlite3_step(ins);
    (void)sqlite3_reset(ins);
    (void)sqlite3_clear_bindings(ins);
    return rc == SQLITE_DONE;
}

BindingRegistry::BindingRegistry(sqlite3* db) : db_(db) {}

bool BindingRegistry::bind(const Binding& b) {
    if (!db_ || b.event.empty() || b.id.empty()) return false;
    sqlite3_stmt* ins = nullptr;
    if (sqlite3_prepare_v2(db_, kInsertSql, -1, &ins, nullptr) != SQLITE_OK) {
        Logger::error("BindingRegistry", std::string("bind prepare failed: ") + sqlite3_errmsg(db_));
        return false;
    }
    const bool ok = insert_row(ins, b);
    (void)sqlite3_finalize(ins);
    if (!ok) {
        Logger::error("BindingRegistry", "bind " + b.event + " -> " + b.realm + "/" + b.id + " failed: " + sqlite3_errmsg(db_));
        return false;
    }
    dirty_ = true;
    return true;
}

// Desc: insert a batch in one transaction; rows without event or id are skipped
// In: const std::vector<Binding>& bindings
// Out: std::size_t (rows added, 0 if the transaction was rolled back)
std::size_t BindingRegistry::bind_array(const std::vector<Binding>& bindings) {
    if (!db_ || bindings.empty()) return 0;
    if (sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        Logger::error("BindingRegistry", std::string("bind_array begin failed: ") + sqlite3_errmsg(db_));
        return 0;
    }

    sqlite3_stmt* ins = nullptr;
    if (sqlite3_prepare_v2(db_, kInsertSql, -1, &ins, nullptr) != SQLITE_OK) {
        Logger::error("BindingRegistry", std::string("bind_array prepare failed: ") + sqlite3_errmsg(db_));
        (void)sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        return 0;
    }
    std::size_t added = 0;
    bool ok = true;
    for (const auto& b : bindings) {
        if (b.event.empty() || b.id.empty()) continue;
        if (!insert_row(ins, b)) {
            Logger::error("BindingRegistry", "bind_array " + b.event + " failed: " + sqlite3_errmsg(db_));
            ok = false;
            break;
        }
        ++added;
    }
    (void)sqlite3_finalize(ins);
    if (!ok) {
        (void)sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        return 0;
    }
    if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        Logger::error("BindingRegistry", std::string("bind_array commit failed: ") + sqlite3_errmsg(db_));
        (void)sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        return 0;
    }
    if (added > 0) dirty_ = true;
    return added;
}

std::size_t BindingRegistry::unbind(const std::string& realm, const std::string& id) {
    if (!db_) return 0;
    const char* sql = id.empty()
        ? "DELETE FROM cache_bindings WHERE c_realm = ?;"
        : "DELETE FROM cache_bindings WHERE c_realm = ? AND c_id = ?;";
    sqlite3_stmt* del = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &del, nullptr) != SQLITE_OK) {
        Logger::error("BindingRegistry", std::string("unbind prepare failed: ") + sqlite3_errmsg(db_));
        return 0;
    }
    sqlite3_bind_text(del, 1, realm.c_str(), -1, SQLITE_TRANSIENT);
    if (!id.empty()) sqlite3_bind_text(del, 2, id.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(del);
    (void)sqlite3_finalize(del);
    if (rc != SQLITE_DONE) {
        Logger::error("BindingRegistry", "unbind " + realm + " failed: " + sqlite3_errmsg(db_));
        return 0;
    }
    const std::size_t n = static_cast<std::size_t>(sqlite3_changes(db_));
    if (n > 0) dirty_ = true;
    return n;
}

// Desc: mirror as {event: [{"id":..,"realm":..,"type":..}, ...]}
// In: (none)
// Out: CacheValue
CacheValue BindingRegistry::to_json() const {
    CacheValue blob = CacheValue::object();
    for (const auto& kv : mirror_) {
        CacheValue arr = CacheValue::array();
        for (const auto& b : kv.second) {
            arr.push_back({{"id", b.id}, {"realm", b.realm}, {"type", static_cast<int>(b.tier)}});
        }
        blob[kv.first] = std::move(arr);
    }
    return blob;
}

bool BindingRegistry::load_mirror(const CacheValue& blob) {
    if (!blob.is_object()) return false;
    std::map<std::string, std::vector<Binding>> m;
    for (auto it = blob.begin(); it != blob.end(); ++it) {
        if (!it.value().is_array()) return false;
        for (const auto& row : it.value()) {
            if (!row.is_object()) return false;
            const auto id = row.find("id");
            const auto realm = row.find("realm");
            const auto type = row.find("type");
            if (id == row.end() || !id->is_string() ||
                realm == row.end() || !realm->is_string() ||
                type == row.end() || !type->is_number_integer()) {
                return false;
            }
            Binding b;
            b.event = it.key();
            b.id = id->get<std::string>();
            b.realm = realm->get<std::string>();
            if (!tier_from_int(type->get<int>(), b.tier)) return false;
            m[b.event].push_back(std::move(b));
        }
    }
    mirror_ = std::move(m);
    warm_ = true;
    dirty_ = false;
    return true;
}

// Desc: rebuild the mirror from cache_bindings
// In: (none)
// Out: CacheValue (the new mirror blob; empty object if the query failed)
CacheValue BindingRegistry::resync() {
    if (!db_) return CacheValue::object();
    sqlite3_stmt* sel = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT c_event, c_id, c_realm, c_type FROM cache_bindings ORDER BY rowid;",
                           -1, &sel, nullptr) != SQLITE_OK) {
        Logger::error("BindingRegistry", std::string("resync prepare failed: ") + sqlite3_errmsg(db_));
        return CacheValue::object();
    }

    std::map<std::string, std::vector<Binding>> m;
    int rc;
    while ((rc = sqlite3_step(sel)) == SQLITE_ROW) {
        const unsigned char* ev = sqlite3_column_text(sel, 0);
        const unsigned char* id = sqlite3_column_text(sel, 1);
        const unsigned char* rl = sqlite3_column_text(sel, 2);
        Binding b;
        if (!ev || !id || !tier_from_int(sqlite3_column_int(sel, 3), b.tier)) continue;
        b.event = reinterpret_cast<const char*>(ev);
        b.id = reinterpret_cast<const char*>(id);
        b.realm = rl ? reinterpret_cast<const char*>(rl) : "";
        m[b.event].push_back(std::move(b));
    }
    (void)sqlite3_finalize(sel);
    if (rc != SQLITE_DONE) {
        Logger::error("BindingRegistry", std::string("resync failed: ") + sqlite3_errmsg(db_));
        return CacheValue::object();
    }

    mirror_ = std::move(m);
    warm_ = true;
    dirty_ = false;
    #ifdef DEBUG
    std::cout << "[BindingRegistry] resync: " << mirror_.size() << " events" << std::endl;
    #endif
    return to_json();
}

std::vector<Binding> BindingRegistry::lookup(const std::string& event) {
    if (!warm_ || dirty_) (void)resync();
    auto it = mirror_.find(event);
    if (it == mirror_.end()) return {};
    return it->second;
}

std::size_t BindingRegistry::size() const {
    std::size_t n = 0;
    for (const auto& kv : mirror_) n += kv.second.size();
    return n;
}
