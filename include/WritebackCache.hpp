#pragma once
#include "CacheDriver.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// Buffers store/remove in memory and writes them back to the wrapped
// BatchStore in one batch when closed. Pending writes are visible to
// get/exists of this instance immediately; other processes see them only
// after the flush. A pending store carries the expiration instant computed
// when it was queued and stops being visible once that instant has passed.
class WritebackCache : public DynamicStore {
public:
    explicit WritebackCache(std::unique_ptr<BatchStore> backend, NowFn now = system_now);
    ~WritebackCache() override;

    WritebackCache(const WritebackCache&) = delete;
    WritebackCache& operator=(const WritebackCache&) = delete;

    bool clear(const std::string& realm) override;
    bool exists(const std::string& id, const std::string& realm) override;
    CacheResult get(const std::string& id, const std::string& realm) override;
    bool remove(const std::string& id, const std::string& realm) override;
    bool store(const std::string& id, const CacheValue& data,
               const std::string& realm, std::int64_t ttl) override;
    // Queued store with an explicit auto-load flag for the durable row
    bool store(const std::string& id, const CacheValue& data,
               const std::string& realm, std::int64_t ttl, bool autoload);
    UsageInfo get_info() override { return backend_->get_info(); }
    std::string driver_id() const override { return backend_->driver_id(); }

    // Write-through variants, bypassing the buffer
    bool store_now(const std::string& id, const CacheValue& data,
                   const std::string& realm, std::int64_t ttl, bool autoload = true);
    bool remove_now(const std::string& id, const std::string& realm);

    // Removals first, then upserts; pending state is dropped either way
    bool flush();
    // Flushes once; later calls are no-ops
    bool close();

    std::size_t pending_stores() const { return writeback_.size(); }
    std::size_t pending_removals() const { return removed_.size(); }
    bool closed() const { return closed_; }

    BatchStore& backend() { return *backend_; }

private:
    using Key = std::pair<std::string, std::string>;   // (realm, id)

    void erase_store(const Key& k);
    // Pending store of k, or nullptr
    const PendingStore* pending(const Key& k) const;
    void drop_pending(const Key& k);

    std::unique_ptr<BatchStore> backend_;
    NowFn now_;
    std::vector<PendingStore> writeback_;
    std::map<Key, std::size_t> writeback_index_;
    std::vector<EntryKey> removed_;
    std::map<Key, bool> removed_index_;
    bool closed_{false};
};
