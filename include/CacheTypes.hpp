#pragma once
#include <cstdint>
#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Value image stored in any tier
using CacheValue = nlohmann::json;
using CacheResult = std::optional<CacheValue>;

// Clock in seconds since the epoch; injected so expiry can be simulated
using NowFn = std::function<std::int64_t()>;

inline std::int64_t system_now() {
    return static_cast<std::int64_t>(std::time(nullptr));
}

inline const char* const kDefaultRealm = "cot";
inline const char* const kSystemRealm  = "system";
inline const std::int64_t kDefaultTtl  = 3600;

// Storage type, persisted as integer in cache_bindings.c_type
enum class TierType : int {
    All    = 0,
    Disk   = 1,
    Db     = 2,
    Memory = 3
};

const char* tier_name(TierType t);
bool parse_tier(const std::string& s, TierType& out);

// Byte image of a value; invalid UTF-8 is replaced rather than thrown on
inline std::string serialize_value(const CacheValue& v) {
    return v.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Empty if raw is not a valid image
inline CacheResult parse_value(const std::string& raw) {
    CacheValue v = CacheValue::parse(raw, nullptr, false);
    if (v.is_discarded()) return std::nullopt;
    return v;
}

struct UsageInfo {
    std::int64_t available{-1};
    std::int64_t occupied{-1};
    std::int64_t max{-1};
};

struct EntryKey {
    std::string id;
    std::string realm;
};

// Queued upsert; expire is absolute (0 = never), fixed when the store was issued
struct PendingStore {
    std::string id;
    CacheValue data;
    std::string realm;
    std::int64_t expire{0};
    bool autoload{true};
};

// Absolute expiration instant of a ttl counted from now; 0 means never
inline std::int64_t expire_after(std::int64_t ttl, std::int64_t now) {
    return ttl > 0 ? now + ttl : 0;
}

inline bool expired(std::int64_t expire, std::int64_t now) {
    return expire != 0 && expire <= now;
}
