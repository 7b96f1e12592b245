#pragma once
#include "CacheDriver.hpp"
#include <string>

// Persistent cache on the local file system: <root>/<realm>/<id>.
// No multilevel structure, so very large realms get slow to clear.
class DiskCache : public StaticStore {
public:
    // Throws std::runtime_error if root is missing or not writable
    explicit DiskCache(const std::string& root);

    bool clear(const std::string& realm) override;
    bool exists(const std::string& id, const std::string& realm) override;
    CacheResult get(const std::string& id, const std::string& realm) override;
    bool remove(const std::string& id, const std::string& realm) override;
    bool store(const std::string& id, const CacheValue& data,
               const std::string& realm) override;

    const std::string& root() const { return root_; }

private:
    std::string realm_dir(const std::string& realm) const;
    std::string entry_path(const std::string& id, const std::string& realm) const;
    bool clear_dir(const std::string& dir);

    std::string root_;
};
