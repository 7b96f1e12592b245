#pragma once
#include "BindingRegistry.hpp"
#include "CacheDriver.hpp"
#include "DbCache.hpp"
#include "DiskCache.hpp"
#include "DriverRegistry.hpp"
#include "WritebackCache.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <sqlite3.h>

// Mirror blob of the binding registry, kept in the system realm of the db tier
#define BINDINGS_MIRROR_ID "cot_cache_bindings"

struct CacheOptions {
    std::string cache_dir;
    // Preferred volatile driver; the first available one is used if empty or absent
    std::string driver;
    // Loaded at startup in addition to "system" and "cot"
    std::vector<std::string> autoload_realms;
};

// One per process. Owns the three tiers and the binding registry; close()
// (or the destructor) persists a dirty binding mirror and flushes the db
// write-back buffer exactly once.
class Cache {
public:
    // Throws std::runtime_error if the disk cache root is not writable
    Cache(const CacheOptions& opts, sqlite3* db, const DriverRegistry& drivers,
          NowFn now = system_now);
    ~Cache();

    Cache(const Cache&) = delete;
    Cache& operator=(const Cache&) = delete;

    // disk tier
    CacheResult disk_get(const std::string& id, const std::string& realm = kDefaultRealm);
    bool disk_set(const std::string& id, const CacheValue& data, const std::string& realm = kDefaultRealm);
    bool disk_unset(const std::string& id, const std::string& realm = kDefaultRealm);
    bool disk_isset(const std::string& id, const std::string& realm = kDefaultRealm);

    // db tier (write-back)
    CacheResult db_get(const std::string& id, const std::string& realm = kDefaultRealm);
    // autoload false keeps the row out of db_load() and startup hydration
    bool db_set(const std::string& id, const CacheValue& data,
                const std::string& realm = kDefaultRealm, std::int64_t ttl = 0,
                bool autoload = true);
    bool db_unset(const std::string& id, const std::string& realm = kDefaultRealm);
    bool db_isset(const std::string& id, const std::string& realm = kDefaultRealm);
    // Adds the autoload rows of realms to autoloaded(); returns rows loaded
    std::size_t db_load(const std::vector<std::string>& realms);

    // mem tier
    CacheResult mem_get(const std::string& id, const std::string& realm = kDefaultRealm);
    bool mem_set(const std::string& id, const CacheValue& data,
                 const std::string& realm = kDefaultRealm, std::int64_t ttl = kDefaultTtl);
    bool mem_unset(const std::string& id, const std::string& realm = kDefaultRealm);
    bool mem_isset(const std::string& id, const std::string& realm = kDefaultRealm);
    std::int64_t mem_inc(const std::string& id, const std::string& realm = kDefaultRealm,
                         std::int64_t delta = 1);
    std::int64_t mem_dec(const std::string& id, const std::string& realm = kDefaultRealm,
                         std::int64_t delta = 1);

    bool clear(TierType tier = TierType::All);
    bool clear_realm(const std::string& realm, TierType tier = TierType::All);

    // Usage of the volatile tier
    UsageInfo get_info();

    // false in degraded mode (db tier serves as mem)
    bool mem_available() const { return mem_owned_ != nullptr; }
    // Selected volatile driver id, empty in degraded mode
    const std::string& mem_driver() const { return mem_driver_; }

    const std::map<std::string, CacheValue>& autoloaded() const { return autoload_; }
    CacheResult autoloaded(const std::string& name) const;

    bool bind(const std::string& event, const std::string& id,
              const std::string& realm = kDefaultRealm, TierType tier = TierType::All);
    std::size_t bind_array(const std::vector<Binding>& bindings);
    std::size_t unbind(const std::string& realm, const std::string& id = "");
    // Removes every entry bound to event; returns the number of bindings processed
    std::size_t trigger(const std::string& event);
    // Removals that failed during the last trigger()
    std::size_t last_trigger_failures() const { return trigger_failures_; }

    void close();
    bool closed() const { return closed_; }

    BindingRegistry& bindings() { return bindings_; }

private:
    DynamicStore& mem() { return mem_owned_ ? *mem_owned_ : static_cast<DynamicStore&>(*db_); }
    void select_mem_driver(const std::string& preferred, const DriverRegistry& drivers);
    void resync_bindings();
    bool clear_tier(const std::string& realm, TierType tier);

    std::unique_ptr<DiskCache> disk_;
    DbCache* db_direct_{nullptr};           // owned by db_
    std::unique_ptr<WritebackCache> db_;
    std::unique_ptr<DynamicStore> mem_owned_;
    std::string mem_driver_;
    BindingRegistry bindings_;
    std::map<std::string, CacheValue> autoload_;
    std::size_t trigger_failures_{0};
    bool closed_{false};
};
