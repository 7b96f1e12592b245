#include "DiskCache.hpp"
#include "CacheKey.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

// Desc: validate cache root (exists, directory, writable)
// In: const std::string& root
// Out: throws std::runtime_error on failure
DiskCache::DiskCache(const std::string& root) : root_(root) {
    if (root_.size() > 1 && root_.back() == '/') root_.pop_back();

    struct stat st{};
    if (root_.empty() || ::stat(root_.c_str(), &st) == -1 || !S_ISDIR(st.st_mode)
        || ::access(root_.c_str(), W_OK | X_OK) != 0) {
        throw std::runtime_error("Cache directory " + root + " is not writeable!");
    }
}

std::string DiskCache::realm_dir(const std::string& realm) const {
    return root_ + "/" + safe_file_name(realm);
}

std::string DiskCache::entry_path(const std::string& id, const std::string& realm) const {
    return realm_dir(realm) + "/" + safe_file_name(id);
}

// Desc: unlink every regular file in dir
// In: const std::string& dir
// Out: bool (false if dir is unreadable)
bool DiskCache::clear_dir(const std::string& dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        Logger::error("DiskCache", "cannot read " + dir + ": " + ec.message());
        return false;
    }
    for (const auto& ent : it) {
        std::error_code fec;
        if (ent.is_regular_file(fec)) {
            fs::remove(ent.path(), fec);
        }
    }
    return true;
}

bool DiskCache::clear(const std::string& realm) {
    if (realm.empty()) {
        std::error_code ec;
        fs::directory_iterator it(root_, ec);
        if (ec) {
            Logger::error("DiskCache", "cannot read " + root_ + ": " + ec.message());
            return false;
        }
        bool ok = true;
        for (const auto& ent : it) {
            const std::string name = ent.path().filename().string();
            std::error_code dec;
            if (!name.empty() && name[0] != '.' && ent.is_directory(dec)) {
                ok = clear_dir(ent.path().string()) && ok;
            }
        }
        return ok;
    }

    const std::string dir = realm_dir(realm);
    std::error_code ec;
    if (!fs::exists(dir, ec)) return true;
    return clear_dir(dir);
}

bool DiskCache::exists(const std::string& id, const std::string& realm) {
    std::error_code ec;
    return fs::is_regular_file(entry_path(id, realm), ec);
}

// Desc: read and parse a stored image
// In: const std::string& id, const std::string& realm
// Out: CacheResult (empty if absent or unreadable)
CacheResult DiskCache::get(const std::string& id, const std::string& realm) {
    const std::string path = entry_path(id, realm);
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return std::nullopt;

    std::string raw((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    CacheResult v = parse_value(raw);
    if (!v) Logger::error("DiskCache", "corrupt cache file " + path);
    return v;
}

bool DiskCache::remove(const std::string& id, const std::string& realm) {
    std::error_code ec;
    return fs::remove(entry_path(id, realm), ec);
}

// Desc: write image through a temp file + rename, creating the realm dir lazily
// In: const std::string& id, const CacheValue& data, const std::string& realm
// Out: bool (true on success)
bool DiskCache::store(const std::string& id, const CacheValue& data, const std::string& realm) {
    const std::string dir = realm_dir(realm);
    if (::mkdir(dir.c_str(), 0755) == -1 && errno != EEXIST) {
        Logger::error("DiskCache", "mkdir " + dir + " failed: " + std::strerror(errno));
        return false;
    }

    const std::string path = entry_path(id, realm);
    const std::string tmp = path + ".tmp" + std::to_string(::getpid());
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            Logger::error("DiskCache", "cannot write " + tmp);
            return false;
        }
        ofs << serialize_value(data);
        if (!ofs.good()) {
            Logger::error("DiskCache", "short write " + tmp);
            ofs.close();
            ::unlink(tmp.c_str());
            return false;
        }
    }
    if (::rename(tmp.c_str(), path.c_str()) == -1) {
        Logger::error("DiskCache", "rename " + tmp + " failed: " + std::strerror(errno));
        ::unlink(tmp.c_str());
        return false;
    }
    return true;
}
