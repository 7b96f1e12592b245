#pragma once
#include "CacheDriver.hpp"
#include <cstdint>
#include <string>

// Flag bit marking a zlib-compressed payload
#define MEMCACHED_FLAG_COMPRESSED 2u

struct MemcachedOptions {
    std::string host{"localhost"};
    int port{11211};
    bool compressed{true};
    int timeout_ms{1000};
};

// Distributed cache over the memcached text protocol. Useful when several
// hosts share one cache server. Realm cleanup is not supported by the
// protocol, so clearing any realm flushes the whole server.
class MemcachedCache : public DynamicStore {
public:
    // Throws std::runtime_error if the server cannot be reached
    explicit MemcachedCache(const MemcachedOptions& opts, NowFn now = system_now);
    ~MemcachedCache() override;

    MemcachedCache(const MemcachedCache&) = delete;
    MemcachedCache& operator=(const MemcachedCache&) = delete;

    bool clear(const std::string& realm) override;
    bool exists(const std::string& id, const std::string& realm) override;
    CacheResult get(const std::string& id, const std::string& realm) override;
    bool remove(const std::string& id, const std::string& realm) override;
    bool store(const std::string& id, const CacheValue& data,
               const std::string& realm, std::int64_t ttl) override;

    // Native incr/decr unless payloads are compressed. A counter the server
    // rejects (non-numeric value) goes through get + store; after an I/O
    // failure nothing is retried and 0 is returned.
    std::int64_t inc(const std::string& id, const std::string& realm,
                     std::int64_t delta = 1) override;
    std::int64_t dec(const std::string& id, const std::string& realm,
                     std::int64_t delta = 1) override;
    UsageInfo get_info() override;
    std::string driver_id() const override { return "memcached"; }

    // Probe: a TCP connection to the server succeeds
    static bool reachable(const MemcachedOptions& opts);

    // Protocol key for (id, realm); hashed if not a valid memcached key
    static std::string server_key(const std::string& id, const std::string& realm);
    // Payload image and its flags
    static std::string encode(const CacheValue& v, bool compressed, unsigned& flags);
    static CacheResult decode(const std::string& payload, unsigned flags);

private:
    static int open_socket(const MemcachedOptions& opts);
    bool ensure_connected();
    void disconnect();
    bool send_all(const std::string& data);
    // closed is set when the server hung up before sending anything
    bool read_line(std::string& line, bool* closed = nullptr);
    bool read_bytes(std::size_t n, std::string& out);
    // Sends req and reads the first reply line. req is resent on a fresh
    // connection only if it cannot have reached the server: the send failed,
    // or a reused connection turned out to be closed by the server.
    bool request(const std::string& req, std::string& reply);
    std::int64_t exptime(std::int64_t ttl) const;

    enum class Native { Applied, Rejected, Failed };
    // Rejected: the server refused the command, nothing changed.
    // Failed: I/O error, the command may or may not have been applied.
    Native native_add(const std::string& key, std::int64_t delta, bool up, std::int64_t& res);
    std::int64_t counter(const std::string& id, const std::string& realm, std::int64_t delta, bool up);

    MemcachedOptions opts_;
    NowFn now_;
    int fd_{-1};
    std::string rbuf_;
};
