#include "CacheKey.hpp"
#include <cctype>
#include <openssl/sha.h>

static const std::size_t kMaxFileNameLen = 128;

// The realm goes through safe_file_name, which never yields a separator, so
// the first separator always ends the realm component.
std::string flat_key(const std::string& id, const std::string& realm) {
    return realm_prefix(realm) + id;
}

std::string realm_prefix(const std::string& realm) {
    return safe_file_name(realm) + REALM_SEPARATOR;
}

// Desc: hash data into hex SHA-256
// In: const std::string& data
// Out: std::string (64 hex chars)
std::string sha256_hex(const std::string& data) {
    unsigned char out[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out);
    static const char* hex = "0123456789abcdef";
    std::string h(2 * SHA256_DIGEST_LENGTH, '0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        h[2*i]   = hex[(out[i]>>4) & 0xF];
        h[2*i+1] = hex[out[i] & 0xF];
    }
    return h;
}

// Desc: keep [A-Za-z0-9_.-] names without leading dot, hash everything else
// In: const std::string& name
// Out: std::string (file name)
std::string safe_file_name(const std::string& name) {
    bool ok = !name.empty() && name.size() <= kMaxFileNameLen && name[0] != '.';
    for (std::size_t i = 0; ok && i < name.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(name[i]);
        ok = std::isalnum(c) || c == '_' || c == '-' || c == '.';
    }
    return ok ? name : sha256_hex(name);
}
