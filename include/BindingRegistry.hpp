#pragma once
#include "CacheTypes.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <sqlite3.h>

// Ties an application event to one cache entry
struct Binding {
    std::string event;
    std::string id;
    std::string realm{kDefaultRealm};
    TierType tier{TierType::All};
};

// Durable event -> entry bindings (cache_bindings table) with an in-process
// mirror grouped by event. Writes mark the mirror dirty; it is rebuilt from
// the table on the next lookup or resync.
class BindingRegistry {
public:
    explicit BindingRegistry(sqlite3* db);

    bool bind(const Binding& b);
    // One transaction; returns the number of rows added
    std::size_t bind_array(const std::vector<Binding>& bindings);
    // Empty id removes every binding of the realm
    std::size_t unbind(const std::string& realm, const std::string& id = "");

    // Adopts a blob produced by resync(); false if it is malformed
    bool load_mirror(const CacheValue& blob);
    // Rebuilds the mirror from the table and returns it as a blob
    CacheValue resync();

    std::vector<Binding> lookup(const std::string& event);

    bool dirty() const { return dirty_; }
    bool warm() const { return warm_; }
    std::size_t size() const;

private:
    CacheValue to_json() const;

    sqlite3* db_{nullptr};
    std::map<std::string, std::vector<Binding>> mirror_;
    bool warm_{false};
    bool dirty_{false};
};
