#include "WritebackCache.hpp"
#include "Logger.hpp"
#include <exception>

WritebackCache::WritebackCache(std::unique_ptr<BatchStore> backend, NowFn now)
    : backend_(std::move(backend)), now_(std::move(now)) {}

WritebackCache::~WritebackCache() {
    try {
        close();
    } catch (const std::exception& e) {
        Logger::error("Writeback", std::string("flush on teardown failed: ") + e.what());
    }
}

void WritebackCache::erase_store(const Key& k) {
    auto wit = writeback_index_.find(k);
    if (wit == writeback_index_.end()) return;
    writeback_.erase(writeback_.begin() + static_cast<std::ptrdiff_t>(wit->second));
    writeback_index_.clear();
    for (std::size_t i = 0; i < writeback_.size(); ++i) {
        writeback_index_[Key(writeback_[i].realm, writeback_[i].id)] = i;
    }
}

const PendingStore* WritebackCache::pending(const Key& k) const {
    auto wit = writeback_index_.find(k);
    return wit == writeback_index_.end() ? nullptr : &writeback_[wit->second];
}

// Desc: forget any queued store/remove of one key
// In: const Key& k
// Out: void
void WritebackCache::drop_pending(const Key& k) {
    erase_store(k);
    if (removed_index_.erase(k) > 0) {
        for (auto it = removed_.begin(); it != removed_.end(); ++it) {
            if (it->realm == k.first && it->id == k.second) {
                removed_.erase(it);
                break;
            }
        }
    }
}

bool WritebackCache::clear(const std::string& realm) {
    if (realm.empty()) {
        writeback_.clear();
        writeback_index_.clear();
        removed_.clear();
        removed_index_.clear();
    } else {
        std::vector<Key> keys;
        for (const auto& kv : writeback_index_) if (kv.first.first == realm) keys.push_back(kv.first);
        for (const auto& kv : removed_index_)   if (kv.first.first == realm) keys.push_back(kv.first);
        for (const auto& k : keys) drop_pending(k);
    }
    return backend_->clear(realm);
}

// A pending store shadows the backend even once it has expired, since the
// flush will overwrite the durable row with it.
bool WritebackCache::exists(const std::string& id, const std::string& realm) {
    const Key k(realm, id);
    if (const PendingStore* p = pending(k)) return !expired(p->expire, now_());
    if (removed_index_.count(k)) return false;
    return backend_->exists(id, realm);
}

CacheResult WritebackCache::get(const std::string& id, const std::string& realm) {
    const Key k(realm, id);
    if (const PendingStore* p = pending(k)) {
        if (expired(p->expire, now_())) return std::nullopt;
        return p->data;
    }
    if (removed_index_.count(k)) return std::nullopt;
    return backend_->get(id, realm);
}

// Desc: queue removal; a store queued earlier for the key is discarded
// In: const std::string& id, const std::string& realm
// Out: bool (true if the entry was visible before)
bool WritebackCache::remove(const std::string& id, const std::string& realm) {
    if (closed_) return remove_now(id, realm);

    const bool visible = exists(id, realm);
    const Key k(realm, id);
    drop_pending(k);
    removed_.push_back(EntryKey{id, realm});
    removed_index_[k] = true;
    return visible;
}

bool WritebackCache::store(const std::string& id, const CacheValue& data,
                           const std::string& realm, std::int64_t ttl) {
    return store(id, data, realm, ttl, true);
}

// Desc: queue store; replaces a queued store of the same key, wins over a queued removal.
//       The expiration instant is fixed now, not at flush time.
// In: const std::string& id, const CacheValue& data, const std::string& realm, std::int64_t ttl, bool autoload
// Out: bool
bool WritebackCache::store(const std::string& id, const CacheValue& data,
                           const std::string& realm, std::int64_t ttl, bool autoload) {
    if (closed_) return store_now(id, data, realm, ttl, autoload);

    const Key k(realm, id);
    erase_store(k);
    writeback_.push_back(PendingStore{id, data, realm, expire_after(ttl, now_()), autoload});
    writeback_index_[k] = writeback_.size() - 1;
    return true;
}

bool WritebackCache::store_now(const std::string& id, const CacheValue& data,
                               const std::string& realm, std::int64_t ttl, bool autoload) {
    drop_pending(Key(realm, id));
    if (autoload) return backend_->store(id, data, realm, ttl);
    return backend_->store_batch({PendingStore{id, data, realm, expire_after(ttl, now_()), false}});
}

bool WritebackCache::remove_now(const std::string& id, const std::string& realm) {
    drop_pending(Key(realm, id));
    return backend_->remove(id, realm);
}

// Desc: apply pending removals as one batch, then pending stores as one batch
// In: (none)
// Out: bool (false if either batch failed)
bool WritebackCache::flush() {
    bool ok = true;
    if (!removed_.empty()) {
        if (!backend_->remove_batch(removed_)) {
            Logger::error("Writeback", "batched delete of " + std::to_string(removed_.size())
                          + " entries failed on " + backend_->driver_id());
            ok = false;
        }
    }
    if (!writeback_.empty()) {
        if (!backend_->store_batch(writeback_)) {
            Logger::error("Writeback", "batched upsert of " + std::to_string(writeback_.size())
                          + " entries failed on " + backend_->driver_id());
            ok = false;
        }
    }
#ifdef DEBUG
    Logger::log("Writeback", "flushed removals=" + std::to_string(removed_.size())
                + " stores=" + std::to_string(writeback_.size()));
#endif
    writeback_.clear();
    writeback_index_.clear();
    removed_.clear();
    removed_index_.clear();
    return ok;
}

bool WritebackCache::close() {
    if (closed_) return true;
    closed_ = true;
    return flush();
}
