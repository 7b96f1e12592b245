// include/ConfigManager.hpp
#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

class ConfigManager {
public:
    explicit ConfigManager() = default;
    bool loadFromFile(const std::string& config_path);
    bool loadFromString(const std::string& text);

    const std::string& getCacheDir()    const { return cache_dir_; }
    const std::string& getCacheDb()     const { return cache_db_; }
    const std::string& getCacheDriver() const { return cache_driver_; }
    const std::string& getLogPath()     const { return log_path_; }
    const std::vector<std::string>& getAutoloadRealms() const { return autoload_realms_; }

    std::int64_t  getDefaultTtl()  const { return default_ttl_; }
    std::uint64_t getMemoryLimit() const { return memory_limit_; }

    const std::string& getMemcachedHost() const { return memcached_host_; }
    int  getMemcachedPort()       const { return memcached_port_; }
    bool getMemcachedCompressed() const { return memcached_compressed_; }

    static std::uint64_t parse_size(const std::string& s);

private:
    bool apply(const nlohmann::json& j);

    std::string cache_dir_;
    std::string cache_db_ = "cache/cache.sqlite";
    std::string cache_driver_;
    std::string log_path_ = "logs/tiercache.log";
    std::vector<std::string> autoload_realms_;
    std::int64_t  default_ttl_ = 3600;
    std::uint64_t memory_limit_ = 64ULL * 1024ULL * 1024ULL;
    std::string memcached_host_ = "localhost";
    int  memcached_port_ = 11211;
    bool memcached_compressed_ = true;
};
