#include "Cache.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

// Desc: remove one entry; a removal fails if the entry is still visible afterwards
// In: CacheDriver& d, const std::string& id, const std::string& realm
// Out: bool (false on failure; an absent entry is not a failure)
static bool evict(CacheDriver& d, const std::string& id, const std::string& realm) {
    (void)d.remove(id, realm);
    return !d.exists(id, realm);
}

// Desc: build the tiers, hydrate autoload realms, pick the volatile driver, warm bindings
// In: const CacheOptions& opts, sqlite3* db, const DriverRegistry& drivers, NowFn now
// Out: (constructor); throws std::runtime_error on an unwritable disk root
Cache::Cache(const CacheOptions& opts, sqlite3* db, const DriverRegistry& drivers, NowFn now)
    : bindings_(db) {
    // 1) disk
    disk_ = std::make_unique<DiskCache>(opts.cache_dir);

    // 2) db behind write-back
    auto direct = std::make_unique<DbCache>(db, now);
    db_direct_ = direct.get();
    db_ = std::make_unique<WritebackCache>(std::move(direct), now);

    // 3) autoload
    std::vector<std::string> realms{kSystemRealm, kDefaultRealm};
    for (const auto& r : opts.autoload_realms) {
        if (std::find(realms.begin(), realms.end(), r) == realms.end()) realms.push_back(r);
    }
    const std::size_t loaded = db_load(realms);
    Logger::log("Cache", "autoloaded " + std::to_string(loaded) + " entries");

    // 4) volatile tier
    select_mem_driver(opts.driver, drivers);

    // 5) binding mirror
    auto blob = autoload_.find(BINDINGS_MIRROR_ID);
    if (blob == autoload_.end() || !bindings_.load_mirror(blob->second)) {
        resync_bindings();
    }
}

Cache::~Cache() {
    try {
        close();
    } catch (const std::exception& e) {
        Logger::error("Cache", std::string("close failed: ") + e.what());
    }
}

// Desc: preferred id if available, else first available, else the db tier
// In: const std::string& preferred, const DriverRegistry& drivers
// Out: void
void Cache::select_mem_driver(const std::string& preferred, const DriverRegistry& drivers) {
    std::vector<std::string> order;
    if (!preferred.empty() && drivers.is_available(preferred)) {
        order.push_back(preferred);
    } else if (!preferred.empty()) {
        Logger::log("Cache", "preferred driver " + preferred + " is not available");
    }
    for (const auto& id : drivers.available_ids()) {
        if (id != preferred) order.push_back(id);
    }

    for (const auto& id : order) {
        mem_owned_ = drivers.create(id);
        if (mem_owned_) {
            mem_driver_ = id;
            Logger::log("Cache", "volatile driver: " + id);
            return;
        }
    }
    mem_driver_.clear();
    Logger::log("Cache", "no volatile driver, db tier serves as mem");
}

// Desc: rebuild the binding mirror and keep it in the system realm of the db tier
// In: (none)
// Out: void
void Cache::resync_bindings() {
    CacheValue blob = bindings_.resync();
    if (!bindings_.warm()) return;
    if (!db_->store(BINDINGS_MIRROR_ID, blob, kSystemRealm, 0)) {
        Logger::error("Cache", "failed to store binding mirror");
    }
    autoload_[BINDINGS_MIRROR_ID] = std::move(blob);
}

CacheResult Cache::disk_get(const std::string& id, const std::string& realm) { return disk_->get(id, realm); }
bool Cache::disk_set(const std::string& id, const CacheValue& data, const std::string& realm) {
    return disk_->store(id, data, realm);
}
bool Cache::disk_unset(const std::string& id, const std::string& realm) { return disk_->remove(id, realm); }
bool Cache::disk_isset(const std::string& id, const std::string& realm) { return disk_->exists(id, realm); }

CacheResult Cache::db_get(const std::string& id, const std::string& realm) { return db_->get(id, realm); }
bool Cache::db_set(const std::string& id, const CacheValue& data, const std::string& realm,
                   std::int64_t ttl, bool autoload) {
    return db_->store(id, data, realm, ttl, autoload);
}
bool Cache::db_unset(const std::string& id, const std::string& realm) { return db_->remove(id, realm); }
bool Cache::db_isset(const std::string& id, const std::string& realm) { return db_->exists(id, realm); }

std::size_t Cache::db_load(const std::vector<std::string>& realms) {
    return db_direct_->get_all(realms, autoload_);
}

CacheResult Cache::mem_get(const std::string& id, const std::string& realm) { return mem().get(id, realm); }
bool Cache::mem_set(const std::string& id, const CacheValue& data, const std::string& realm, std::int64_t ttl) {
    return mem().store(id, data, realm, ttl);
}
bool Cache::mem_unset(const std::string& id, const std::string& realm) { return mem().remove(id, realm); }
bool Cache::mem_isset(const std::string& id, const std::string& realm) { return mem().exists(id, realm); }
std::int64_t Cache::mem_inc(const std::string& id, const std::string& realm, std::int64_t delta) {
    return mem().inc(id, realm, delta);
}
std::int64_t Cache::mem_dec(const std::string& id, const std::string& realm, std::int64_t delta) {
    return mem().dec(id, realm, delta);
}

// Desc: clear one tier, or mem, db and disk in that order
// In: const std::string& realm (empty = all realms), TierType tier
// Out: bool (false if any tier failed)
bool Cache::clear_tier(const std::string& realm, TierType tier) {
    switch (tier) {
        case TierType::Disk:   return disk_->clear(realm);
        case TierType::Db:     return db_->clear(realm);
        case TierType::Memory: return mem().clear(realm);
        case TierType::All: {
            bool ok = mem().clear(realm);
            ok = db_->clear(realm) && ok;
            ok = disk_->clear(realm) && ok;
            return ok;
        }
    }
    return false;
}

bool Cache::clear(TierType tier) { return clear_tier("", tier); }

bool Cache::clear_realm(const std::string& realm, TierType tier) {
    if (realm.empty()) return false;
    return clear_tier(realm, tier);
}

UsageInfo Cache::get_info() { return mem().get_info(); }

CacheResult Cache::autoloaded(const std::string& name) const {
    auto it = autoload_.find(name);
    if (it == autoload_.end()) return std::nullopt;
    return it->second;
}

bool Cache::bind(const std::string& event, const std::string& id, const std::string& realm, TierType tier) {
    return bindings_.bind(Binding{event, id, realm, tier});
}

std::size_t Cache::bind_array(const std::vector<Binding>& bindings) { return bindings_.bind_array(bindings); }

std::size_t Cache::unbind(const std::string& realm, const std::string& id) { return bindings_.unbind(realm, id); }

// Desc: remove every entry bound to event from its tier; failures are counted, not fatal
// In: const std::string& event
// Out: std::size_t (bindings processed)
std::size_t Cache::trigger(const std::string& event) {
    trigger_failures_ = 0;
    if (!bindings_.warm() || bindings_.dirty()) resync_bindings();

    const std::vector<Binding> bound = bindings_.lookup(event);
    for (const auto& b : bound) {
        bool ok = true;
        switch (b.tier) {
            case TierType::Disk:   ok = evict(*disk_, b.id, b.realm); break;
            case TierType::Db:     ok = evict(*db_, b.id, b.realm); break;
            case TierType::Memory: ok = evict(mem(), b.id, b.realm); break;
            case TierType::All:
                ok = evict(mem(), b.id, b.realm);
                ok = evict(*disk_, b.id, b.realm) && ok;
                ok = evict(*db_, b.id, b.realm) && ok;
                break;
        }
        if (!ok) {
            ++trigger_failures_;
            Logger::error("Cache", "trigger " + event + ": failed to remove " + b.realm + "/" + b.id +
                                   " from " + tier_name(b.tier));
        }
    }
    #ifdef DEBUG
    std::cout << "[Cache] trigger " << event << ": " << bound.size() << " bindings" << std::endl;
    #endif
    return bound.size();
}

// Desc: persist a dirty binding mirror, then flush the db write-back buffer; runs once
// In: (none)
// Out: void
void Cache::close() {
    if (closed_) return;
    closed_ = true;
    if (bindings_.dirty()) resync_bindings();
    if (!db_->close()) {
        Logger::error("Cache", "db write-back flush reported failures");
    }
}
