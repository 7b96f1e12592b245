#pragma once
#include "CacheTypes.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Operations common to every tier
class CacheDriver {
public:
    virtual ~CacheDriver() = default;

    // Empty realm clears every realm served by the driver
    virtual bool clear(const std::string& realm) = 0;
    virtual bool exists(const std::string& id, const std::string& realm) = 0;
    virtual CacheResult get(const std::string& id, const std::string& realm) = 0;
    // false if the entry was absent
    virtual bool remove(const std::string& id, const std::string& realm) = 0;
};

// Large, rarely modified data without expiry
class StaticStore : public CacheDriver {
public:
    virtual bool store(const std::string& id, const CacheValue& data,
                       const std::string& realm) = 0;
};

class AtomicCounter {
public:
    virtual ~AtomicCounter() = default;
    virtual std::int64_t inc(const std::string& id, const std::string& realm,
                             std::int64_t delta = 1) = 0;
    virtual std::int64_t dec(const std::string& id, const std::string& realm,
                             std::int64_t delta = 1) = 0;
};

class UsageReporter {
public:
    virtual ~UsageReporter() = default;
    virtual UsageInfo get_info() = 0;
};

// Entries with time to live. inc/dec default to get + store, which is not
// atomic across processes; drivers with native counters override them.
class DynamicStore : public CacheDriver, public AtomicCounter, public UsageReporter {
public:
    // ttl == 0 means no expiry
    virtual bool store(const std::string& id, const CacheValue& data,
                       const std::string& realm, std::int64_t ttl) = 0;

    std::int64_t inc(const std::string& id, const std::string& realm,
                     std::int64_t delta = 1) override;
    std::int64_t dec(const std::string& id, const std::string& realm,
                     std::int64_t delta = 1) override;
    UsageInfo get_info() override { return UsageInfo{}; }

    virtual std::string driver_id() const = 0;

protected:
    std::int64_t add_composed(const std::string& id, const std::string& realm,
                              std::int64_t delta);
};

// Durable dynamic store able to apply a write-back batch in one go
class BatchStore : public DynamicStore {
public:
    virtual bool remove_batch(const std::vector<EntryKey>& keys) = 0;
    virtual bool store_batch(const std::vector<PendingStore>& entries) = 0;
};

// Numeric view of a stored value; absent or non-numeric counts as 0
std::int64_t counter_value(const CacheResult& v);
