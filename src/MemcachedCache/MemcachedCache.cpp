#include "MemcachedCache.hpp"
#include "CacheKey.hpp"
#include "Logger.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <zlib.h>

static const std::size_t kMaxKeyLen = 250;
static const std::int64_t kRelativeExpireMax = 60 * 60 * 24 * 30;   // beyond: absolute unix time

MemcachedCache::MemcachedCache(const MemcachedOptions& opts, NowFn now)
    : opts_(opts), now_(std::move(now)) {
    fd_ = open_socket(opts_);
    if (fd_ < 0) {
        throw std::runtime_error("memcached server " + opts_.host + ":"
                                 + std::to_string(opts_.port) + " is unreachable");
    }
}

MemcachedCache::~MemcachedCache() {
    disconnect();
}

// Desc: connect with timeout to the first resolvable address
// In: const MemcachedOptions& opts
// Out: int (blocking socket fd, -1 on failure)
int MemcachedCache::open_socket(const MemcachedOptions& opts) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    const std::string port = std::to_string(opts.port);
    if (::getaddrinfo(opts.host.c_str(), port.c_str(), &hints, &res) != 0 || !res) return -1;

    int fd = -1;
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK, ai->ai_protocol);
        if (fd < 0) continue;

        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd{fd, POLLOUT, 0};
            if (::poll(&pfd, 1, opts.timeout_ms) == 1) {
                int err = 0;
                socklen_t len = sizeof(err);
                if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0) rc = 0;
            }
        }
        if (rc == 0) {
            const int fl = ::fcntl(fd, F_GETFL, 0);
            if (fl != -1 && ::fcntl(fd, F_SETFL, fl & ~O_NONBLOCK) == 0) break;
        }
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);
    return fd;
}

bool MemcachedCache::reachable(const MemcachedOptions& opts) {
    const int fd = open_socket(opts);
    if (fd < 0) return false;
    ::close(fd);
    return true;
}

void MemcachedCache::disconnect() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
    rbuf_.clear();
}

bool MemcachedCache::ensure_connected() {
    if (fd_ >= 0) return true;
    fd_ = open_socket(opts_);
    if (fd_ < 0) {
        Logger::error("Memcached", "reconnect to " + opts_.host + ":" + std::to_string(opts_.port) + " failed");
        return false;
    }
    return true;
}

bool MemcachedCache::send_all(const std::string& data) {
    std::size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<std::size_t>(n);
    }
    return true;
}

// Desc: read one CRLF-terminated line (without CRLF) with timeout
// In: std::string& line, bool* closed (optional)
// Out: bool (false on timeout, EOF or error)
bool MemcachedCache::read_line(std::string& line, bool* closed) {
    if (closed) *closed = false;
    while (true) {
        const std::size_t pos = rbuf_.find("\r\n");
        if (pos != std::string::npos) {
            line = rbuf_.substr(0, pos);
            rbuf_.erase(0, pos + 2);
            return true;
        }
        struct pollfd pfd{fd_, POLLIN, 0};
        const int pr = ::poll(&pfd, 1, opts_.timeout_ms);
        if (pr < 0 && errno == EINTR) continue;
        if (pr <= 0) return false;
        char buf[4096];
        const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            if (closed && rbuf_.empty() && (n == 0 || errno == ECONNRESET)) *closed = true;
            return false;
        }
        rbuf_.append(buf, static_cast<std::size_t>(n));
    }
}

bool MemcachedCache::read_bytes(std::size_t n, std::string& out) {
    while (rbuf_.size() < n) {
        struct pollfd pfd{fd_, POLLIN, 0};
        const int pr = ::poll(&pfd, 1, opts_.timeout_ms);
        if (pr < 0 && errno == EINTR) continue;
        if (pr <= 0) return false;
        char buf[4096];
        const ssize_t r = ::recv(fd_, buf, sizeof(buf), 0);
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) return false;
        rbuf_.append(buf, static_cast<std::size_t>(r));
    }
    out = rbuf_.substr(0, n);
    rbuf_.erase(0, n);
    return true;
}

bool MemcachedCache::request(const std::string& req, std::string& reply) {
    for (int attempt = 0; attempt < 2; ++attempt) {
        const bool reused = fd_ >= 0;
        if (!ensure_connected()) return false;
        if (!send_all(req)) {
            disconnect();
            continue;
        }
        bool closed = false;
        if (read_line(reply, &closed)) return true;
        disconnect();
        // A late or lost reply may belong to an applied incr/add
        if (!reused || !closed) break;
    }
    Logger::error("Memcached", "request failed: " + req.substr(0, req.find("\r\n")));
    return false;
}

std::int64_t MemcachedCache::exptime(std::int64_t ttl) const {
    if (ttl <= 0) return 0;
    return ttl > kRelativeExpireMax ? now_() + ttl : ttl;
}

std::string MemcachedCache::server_key(const std::string& id, const std::string& realm) {
    const std::string key = flat_key(id, realm);
    bool ok = !key.empty() && key.size() <= kMaxKeyLen;
    for (std::size_t i = 0; ok && i < key.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(key[i]);
        ok = !std::isspace(c) && !std::iscntrl(c);
    }
    return ok ? key : realm_prefix(realm) + sha256_hex(key);
}

// Desc: serialize and optionally deflate a value
// In: const CacheValue& v, bool compressed, unsigned& flags
// Out: std::string (payload)
std::string MemcachedCache::encode(const CacheValue& v, bool compressed, unsigned& flags) {
    const std::string raw = serialize_value(v);
    flags = 0;
    if (!compressed) return raw;

    uLongf len = compressBound(static_cast<uLong>(raw.size()));
    std::string out(len, '\0');
    if (compress2(reinterpret_cast<Bytef*>(&out[0]), &len,
                  reinterpret_cast<const Bytef*>(raw.data()), static_cast<uLong>(raw.size()),
                  Z_DEFAULT_COMPRESSION) != Z_OK) {
        Logger::error("Memcached", "compression failed, storing raw payload");
        return raw;
    }
    out.resize(len);
    flags = MEMCACHED_FLAG_COMPRESSED;
    return out;
}

// Desc: inflate (if flagged) and parse a payload
// In: const std::string& payload, unsigned flags
// Out: CacheResult (empty on corrupt payload)
CacheResult MemcachedCache::decode(const std::string& payload, unsigned flags) {
    if (!(flags & MEMCACHED_FLAG_COMPRESSED)) return parse_value(payload);

    z_stream zs{};
    if (inflateInit(&zs) != Z_OK) return std::nullopt;
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(payload.data()));
    zs.avail_in = static_cast<uInt>(payload.size());

    std::string raw;
    std::vector<char> chunk(16384);
    int rc = Z_OK;
    while (rc == Z_OK) {
        zs.next_out = reinterpret_cast<Bytef*>(chunk.data());
        zs.avail_out = static_cast<uInt>(chunk.size());
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) break;
        raw.append(chunk.data(), chunk.size() - zs.avail_out);
    }
    inflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        Logger::error("Memcached", "corrupt compressed payload");
        return std::nullopt;
    }
    return parse_value(raw);
}

// Desc: flush_all; the protocol has no per-realm cleanup
// In: const std::string& realm
// Out: bool (true on OK)
bool MemcachedCache::clear(const std::string& realm) {
    if (!realm.empty()) {
        Logger::log("Memcached", "clear of realm '" + realm + "' flushes the whole server");
    }
    std::string reply;
    return request("flush_all\r\n", reply) && reply == "OK";
}

bool MemcachedCache::exists(const std::string& id, const std::string& realm) {
    return get(id, realm).has_value();
}

CacheResult MemcachedCache::get(const std::string& id, const std::string& realm) {
    std::string line;
    if (!request("get " + server_key(id, realm) + "\r\n", line)) return std::nullopt;
    if (line == "END") return std::nullopt;

    // VALUE <key> <flags> <bytes>
    char keybuf[kMaxKeyLen + 1];
    unsigned flags = 0;
    unsigned long bytes = 0;
    if (std::sscanf(line.c_str(), "VALUE %250s %u %lu", keybuf, &flags, &bytes) != 3) {
        Logger::error("Memcached", "unexpected reply: " + line);
        disconnect();
        return std::nullopt;
    }
    std::string payload;
    std::string end;
    if (!read_bytes(bytes + 2, payload) || !read_line(end) || end != "END") {
        Logger::error("Memcached", "truncated reply for " + server_key(id, realm));
        disconnect();
        return std::nullopt;
    }
    payload.resize(bytes);
    return decode(payload, flags);
}

bool MemcachedCache::remove(const std::string& id, const std::string& realm) {
    std::string reply;
    return request("delete " + server_key(id, realm) + "\r\n", reply) && reply == "DELETED";
}

bool MemcachedCache::store(const std::string& id, const CacheValue& data,
                           const std::string& realm, std::int64_t ttl) {
    unsigned flags = 0;
    const std::string payload = encode(data, opts_.compressed, flags);
    const std::string req = "set " + server_key(id, realm) + " " + std::to_string(flags) + " "
        + std::to_string(exptime(ttl)) + " " + std::to_string(payload.size()) + "\r\n"
        + payload + "\r\n";
    std::string reply;
    if (!request(req, reply)) return false;
    if (reply != "STORED") {
        Logger::error("Memcached", "set " + server_key(id, realm) + ": " + reply);
        return false;
    }
    return true;
}

// Desc: incr/decr; a missing counter is created with `add` when counting up
// In: const std::string& key, std::int64_t delta, bool up, std::int64_t& res
// Out: Native (Rejected if the generic composition must be used instead)
MemcachedCache::Native MemcachedCache::native_add(const std::string& key, std::int64_t delta,
                                                  bool up, std::int64_t& res) {
    const std::string cmd = std::string(up ? "incr " : "decr ") + key + " " + std::to_string(delta) + "\r\n";
    for (int attempt = 0; attempt < 2; ++attempt) {
        std::string reply;
        if (!request(cmd, reply)) return Native::Failed;
        if (!reply.empty() && std::isdigit(static_cast<unsigned char>(reply[0]))) {
            res = static_cast<std::int64_t>(std::strtoll(reply.c_str(), nullptr, 10));
            return Native::Applied;
        }
        if (reply != "NOT_FOUND" || !up) return Native::Rejected;

        const std::string val = std::to_string(delta);
        const std::string add = "add " + key + " 0 0 " + std::to_string(val.size()) + "\r\n" + val + "\r\n";
        if (!request(add, reply)) return Native::Failed;
        if (reply == "STORED") {
            res = delta;
            return Native::Applied;
        }
        // NOT_STORED: created concurrently, incr again
    }
    return Native::Rejected;
}

// Desc: native counter step, falling back to get + store only when the server refused it
// In: const std::string& id, const std::string& realm, std::int64_t delta (> 0), bool up
// Out: std::int64_t (new value, 0 after an I/O failure)
std::int64_t MemcachedCache::counter(const std::string& id, const std::string& realm,
                                     std::int64_t delta, bool up) {
    std::int64_t res = 0;
    switch (native_add(server_key(id, realm), delta, up, res)) {
        case Native::Applied:
            return res;
        case Native::Failed:
            Logger::error("Memcached", std::string(up ? "incr " : "decr ") + realm + "/" + id
                          + " outcome unknown, not retried");
            return 0;
        case Native::Rejected:
            break;
    }
    return add_composed(id, realm, up ? delta : -delta);
}

std::int64_t MemcachedCache::inc(const std::string& id, const std::string& realm, std::int64_t delta) {
    if (opts_.compressed) return DynamicStore::inc(id, realm, delta);
    if (delta < 0) return dec(id, realm, -delta);
    return counter(id, realm, delta, true);
}

std::int64_t MemcachedCache::dec(const std::string& id, const std::string& realm, std::int64_t delta) {
    if (opts_.compressed) return DynamicStore::dec(id, realm, delta);
    if (delta < 0) return inc(id, realm, -delta);
    return counter(id, realm, delta, false);
}

// Desc: usage from `stats` (limit_maxbytes, bytes)
// In: (none)
// Out: UsageInfo
UsageInfo MemcachedCache::get_info() {
    UsageInfo info;
    std::string line;
    if (!request("stats\r\n", line)) return info;
    while (line != "END") {
        char name[64];
        long long value = 0;
        if (std::sscanf(line.c_str(), "STAT %63s %lld", name, &value) == 2) {
            if (std::strcmp(name, "limit_maxbytes") == 0) info.max = value;
            else if (std::strcmp(name, "bytes") == 0) info.occupied = value;
        }
        if (!read_line(line)) {
            disconnect();
            return UsageInfo{};
        }
    }
    if (info.max >= 0 && info.occupied >= 0) info.available = info.max - info.occupied;
    return info;
}
