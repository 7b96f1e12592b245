#pragma once
#include "CacheDriver.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <sqlite3.h>

// Relational cache on the `cache` table (c_name, c_realm, c_expire, c_auto, c_value).
// Slower than the memory tier but durable. Wrapped by WritebackCache in the
// controller so stores are flushed in one batch.
class DbCache : public BatchStore {
public:
    // Collects expired rows right away
    explicit DbCache(sqlite3* db, NowFn now = system_now);

    bool clear(const std::string& realm) override;
    bool exists(const std::string& id, const std::string& realm) override;
    CacheResult get(const std::string& id, const std::string& realm) override;
    bool remove(const std::string& id, const std::string& realm) override;
    bool store(const std::string& id, const CacheValue& data,
               const std::string& realm, std::int64_t ttl) override;

    // Upsert with an explicit auto-load flag; rows with autoload false are
    // skipped by get_all
    bool store(const std::string& id, const CacheValue& data,
               const std::string& realm, std::int64_t ttl, bool autoload);

    bool remove_batch(const std::vector<EntryKey>& keys) override;
    bool store_batch(const std::vector<PendingStore>& entries) override;

    // Loads all autoload rows of the realms into out (name -> value)
    std::size_t get_all(const std::vector<std::string>& realms,
                        std::map<std::string, CacheValue>& out);
    // Deletes expired rows, returns the number removed
    int gc();

    UsageInfo get_info() override;
    std::string driver_id() const override { return "sqlite"; }

private:
    struct Buffered {
        CacheValue value;
        std::int64_t expire{0};
    };
    using Key = std::pair<std::string, std::string>;   // (realm, id)

    std::int64_t expire_at(std::int64_t ttl) const { return expire_after(ttl, now_()); }
    bool upsert(sqlite3_stmt* stmt, const PendingStore& e);
    bool fetch(const std::string& id, const std::string& realm);
    bool exec(const char* sql);
    bool commit();
    std::int64_t pragma_int(const char* sql);

    sqlite3* db_{nullptr};
    NowFn now_;
    std::map<Key, Buffered> buffer_;
};
