#pragma once
#include "CacheDriver.hpp"
#include <cstdint>
#include <string>
#include <sqlite3.h>

#define MEMDB_DEFAULT_NAME "/tiercache-volatile"

// Volatile tier on an SQLite in-memory database (memdb VFS). A name starting
// with '/' is shared by every connection opened with it in this process, and
// the content vanishes with the last connection.
class MemdbCache : public DynamicStore {
public:
    // Throws std::runtime_error if the database cannot be opened
    explicit MemdbCache(std::uint64_t max_bytes = 0,
                        const std::string& name = MEMDB_DEFAULT_NAME,
                        NowFn now = system_now);
    ~MemdbCache() override;

    MemdbCache(const MemdbCache&) = delete;
    MemdbCache& operator=(const MemdbCache&) = delete;

    bool clear(const std::string& realm) override;
    bool exists(const std::string& id, const std::string& realm) override;
    CacheResult get(const std::string& id, const std::string& realm) override;
    bool remove(const std::string& id, const std::string& realm) override;
    bool store(const std::string& id, const CacheValue& data,
               const std::string& realm, std::int64_t ttl) override;

    std::int64_t inc(const std::string& id, const std::string& realm,
                     std::int64_t delta = 1) override;
    std::int64_t dec(const std::string& id, const std::string& realm,
                     std::int64_t delta = 1) override;
    UsageInfo get_info() override;
    std::string driver_id() const override { return "memdb"; }

    // true if this SQLite build registers the memdb VFS
    static bool supported();

private:
    std::int64_t add(const std::string& key, std::int64_t delta);
    bool exec(const char* sql);
    std::int64_t pragma_int(const char* sql);

    sqlite3* db_{nullptr};
    NowFn now_;
};
