#pragma once
#include "CacheDriver.hpp"
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

// In-process memory tier: hash map keyed by "realm/id" with TTL and
// least-recently-used eviction once max_bytes is exceeded (0 = unbounded).
class ProcessCache : public DynamicStore {
public:
    struct Entry {
        CacheValue value;
        std::int64_t expire{0};
        std::int64_t last_access_ts{0};
        std::uint64_t bytes{0};
    };

    explicit ProcessCache(std::uint64_t max_bytes = 0, NowFn now = system_now)
        : max_bytes_(max_bytes), now_(std::move(now)) {}

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
    std::string driver_id() const override { return "process"; }

    std::size_t size() const;

private:
    bool live(const Entry& e, std::int64_t now) const { return e.expire == 0 || e.expire > now; }
    std::int64_t add_locked(const std::string& key, std::int64_t delta);
    void put_locked(const std::string& key, const CacheValue& data, std::int64_t expire);
    void evict_lru_locked(std::uint64_t incoming);

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, Entry> map_;
    std::uint64_t max_bytes_{0};
    std::uint64_t live_bytes_{0};
    NowFn now_;
};
