#include "CacheDriver.hpp"
#include "Logger.hpp"

// Desc: printable name of a storage type
// In: TierType t
// Out: const char*
const char* tier_name(TierType t) {
    switch (t) {
        case TierType::Disk:   return "disk";
        case TierType::Db:     return "db";
        case TierType::Memory: return "mem";
        default:               return "all";
    }
}

// Desc: parse tier name (all/disk/db/mem) or its numeric value
// In: const std::string& s, TierType& out
// Out: bool (false on unknown name)
bool parse_tier(const std::string& s, TierType& out) {
    if (s == "all" || s == "0")                       { out = TierType::All;    return true; }
    if (s == "disk" || s == "1")                      { out = TierType::Disk;   return true; }
    if (s == "db" || s == "2")                        { out = TierType::Db;     return true; }
    if (s == "mem" || s == "memory" || s == "3")      { out = TierType::Memory; return true; }
    return false;
}

std::int64_t counter_value(const CacheResult& v) {
    if (!v) return 0;
    if (v->is_number_integer()) return v->get<std::int64_t>();
    if (v->is_number()) return static_cast<std::int64_t>(v->get<double>());
    return 0;
}

// Desc: read, add, write back under the same key (no expiry)
// In: const std::string& id, const std::string& realm, std::int64_t delta
// Out: std::int64_t (new value)
std::int64_t DynamicStore::add_composed(const std::string& id, const std::string& realm,
                                        std::int64_t delta) {
    const std::int64_t res = counter_value(get(id, realm)) + delta;
    if (!store(id, CacheValue(res), realm, 0)) {
        Logger::error("CacheDriver", "counter " + realm + "/" + id + " not stored on " + driver_id());
    }
    return res;
}

std::int64_t DynamicStore::inc(const std::string& id, const std::string& realm, std::int64_t delta) {
    return add_composed(id, realm, delta);
}

std::int64_t DynamicStore::dec(const std::string& id, const std::string& realm, std::int64_t delta) {
    return add_composed(id, realm, -delta);
}
