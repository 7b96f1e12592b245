#include "ProcessCache.hpp"
#include "CacheKey.hpp"
#include <algorithm>
#include <iostream>
#include <mutex>
#include <vector>

// ---------------------------
// LRU (oldest by last_access)
// ---------------------------
// Desc: make room for `incoming` bytes; expired entries go first, then the
//       least recently used ones
// In: std::uint64_t incoming
// Out: void
void ProcessCache::evict_lru_locked(std::uint64_t incoming) {
    if (max_bytes_ == 0 || live_bytes_ + incoming <= max_bytes_) return;

    const std::int64_t now = now_();
    struct Row { std::string key; std::int64_t last_ts; };
    std::vector<Row> rows;
    rows.reserve(map_.size());
    for (auto it = map_.begin(); it != map_.end();) {
        if (!live(it->second, now)) {
            live_bytes_ -= it->second.bytes;
            it = map_.erase(it);
            continue;
        }
        rows.push_back(Row{it->first, it->second.last_access_ts});
        ++it;
    }
    if (live_bytes_ + incoming <= max_bytes_) return;

    std::sort(rows.begin(), rows.end(), [](const Row& a, const Row& b){
        return a.last_ts < b.last_ts;
    });
    std::size_t evicted = 0;
    for (const auto& r : rows) {
        if (live_bytes_ + incoming <= max_bytes_) break;
        auto it = map_.find(r.key);
        live_bytes_ -= it->second.bytes;
        map_.erase(it);
        ++evicted;
    }
    #ifdef DEBUG
    std::cout << "[ProcessCache][evict] Cache full. Removed " << evicted
              << " least recently used items" << std::endl;
    #else
    (void)evicted;
    #endif
}

// Desc: insert or replace one entry, accounting its footprint
// In: const std::string& key, const CacheValue& data, std::int64_t expire
// Out: void
void ProcessCache::put_locked(const std::string& key, const CacheValue& data, std::int64_t expire) {
    auto old = map_.find(key);
    if (old != map_.end()) {
        live_bytes_ -= old->second.bytes;
        map_.erase(old);
    }
    Entry ent{};
    ent.value = data;
    ent.expire = expire;
    ent.last_access_ts = now_();
    ent.bytes = static_cast<std::uint64_t>(key.size() + serialize_value(data).size()
                                           + sizeof(Entry) + sizeof(void*));
    evict_lru_locked(ent.bytes);
    live_bytes_ += ent.bytes;
    map_.emplace(key, std::move(ent));
}

bool ProcessCache::clear(const std::string& realm) {
    std::unique_lock wlk(mu_);
    if (realm.empty()) {
        map_.clear();
        live_bytes_ = 0;
        return true;
    }
    const std::string prefix = realm_prefix(realm);
    for (auto it = map_.begin(); it != map_.end();) {
        if (it->first.compare(0, prefix.size(), prefix) == 0) {
            live_bytes_ -= it->second.bytes;
            it = map_.erase(it);
        } else {
            ++it;
        }
    }
    return true;
}

bool ProcessCache::exists(const std::string& id, const std::string& realm) {
    std::shared_lock rlk(mu_);
    auto it = map_.find(flat_key(id, realm));
    return it != map_.end() && live(it->second, now_());
}

CacheResult ProcessCache::get(const std::string& id, const std::string& realm) {
    std::unique_lock wlk(mu_);
    auto it = map_.find(flat_key(id, realm));
    if (it == map_.end()) return std::nullopt;
    const std::int64_t now = now_();
    if (!live(it->second, now)) {
        live_bytes_ -= it->second.bytes;
        map_.erase(it);
        return std::nullopt;
    }
    it->second.last_access_ts = now;
    return it->second.value;
}

bool ProcessCache::remove(const std::string& id, const std::string& realm) {
    std::unique_lock wlk(mu_);
    auto it = map_.find(flat_key(id, realm));
    if (it == map_.end()) return false;
    const bool was_live = live(it->second, now_());
    live_bytes_ -= it->second.bytes;
    map_.erase(it);
    return was_live;
}

bool ProcessCache::store(const std::string& id, const CacheValue& data,
                         const std::string& realm, std::int64_t ttl) {
    std::unique_lock wlk(mu_);
    put_locked(flat_key(id, realm), data, ttl > 0 ? now_() + ttl : 0);
    return true;
}

// Desc: counter update under the write lock; keeps the entry's expiry
// In: const std::string& key, std::int64_t delta
// Out: std::int64_t (new value)
std::int64_t ProcessCache::add_locked(const std::string& key, std::int64_t delta) {
    std::int64_t expire = 0;
    CacheResult cur;
    auto it = map_.find(key);
    if (it != map_.end() && live(it->second, now_())) {
        cur = it->second.value;
        expire = it->second.expire;
    }
    const std::int64_t res = counter_value(cur) + delta;
    put_locked(key, CacheValue(res), expire);
    return res;
}

std::int64_t ProcessCache::inc(const std::string& id, const std::string& realm, std::int64_t delta) {
    std::unique_lock wlk(mu_);
    return add_locked(flat_key(id, realm), delta);
}

std::int64_t ProcessCache::dec(const std::string& id, const std::string& realm, std::int64_t delta) {
    std::unique_lock wlk(mu_);
    return add_locked(flat_key(id, realm), -delta);
}

// Desc: approximate footprint of the map (buckets + entries)
// In: (none)
// Out: UsageInfo (max/available -1 when unbounded)
UsageInfo ProcessCache::get_info() {
    std::shared_lock rlk(mu_);
    UsageInfo info;
    const std::uint64_t bucket_bytes =
        static_cast<std::uint64_t>(map_.bucket_count()) * sizeof(void*);
    info.occupied = static_cast<std::int64_t>(live_bytes_ + bucket_bytes);
    if (max_bytes_ > 0) {
        info.max = static_cast<std::int64_t>(max_bytes_);
        info.available = std::max<std::int64_t>(0, info.max - info.occupied);
    }
    return info;
}

std::size_t ProcessCache::size() const {
    std::shared_lock rlk(mu_);
    return map_.size();
}
