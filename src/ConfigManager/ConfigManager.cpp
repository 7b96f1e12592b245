// === ConfigManager.cpp ===
#include "ConfigManager.hpp"

#include <fstream>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>
#include <stdexcept>
#include <nlohmann/json.hpp>
using nlohmann::json;

// Desc: trim leading and trailing spaces inplace
// In: std::string& t
// Out: void
static inline void trim_inplace(std::string& t) {
    t.erase(t.begin(), std::find_if(t.begin(), t.end(), [](unsigned char c){ return !std::isspace(c); }));
    t.erase(std::find_if(t.rbegin(), t.rend(), [](unsigned char c){ return !std::isspace(c); }).base(), t.end());
}

// Desc: parse size string (plain bytes or K/KB/M/MB/G/GB) into bytes
// In: const std::string& raw
// Out: std::uint64_t (bytes); throws on invalid input
std::uint64_t ConfigManager::parse_size(const std::string& raw) {
    std::string in = raw;
    trim_inplace(in);

    static const std::regex re(R"(^([0-9]+)\s*([kKmMgG][bB]?)?$)");
    std::smatch m;
    if (!std::regex_match(in, m, re)) {
        throw std::runtime_error("invalid size (expect like '512KB', '64MB', '1G'): '" + raw + "'");
    }

    std::uint64_t n = 0;
    try {
        n = std::stoull(m[1].str());
    } catch (const std::exception&) {
        throw std::runtime_error("invalid number : '" + raw + "'");
    }

    std::string unit = m[2].str();
    for (auto& c : unit) c = (char)std::toupper((unsigned char)c);

    if (unit.empty()) return n;
    if (unit == "K" || unit == "KB") return n * 1024ULL;
    if (unit == "M" || unit == "MB") return n * 1024ULL * 1024ULL;
    if (unit == "G" || unit == "GB") return n * 1024ULL * 1024ULL * 1024ULL;
    throw std::runtime_error("unreachable unit");
}

bool ConfigManager::loadFromFile(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "[ConfigManager] cannot open file: " << config_path << "\n";
        return false;
    }

    json j;
    try { file >> j; }
    catch (const std::exception& e) { std::cerr << "[ConfigManager] invalid JSON: " << e.what() << "\n"; return false; }
    return apply(j);
}

bool ConfigManager::loadFromString(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        std::cerr << "[ConfigManager] invalid JSON\n";
        return false;
    }
    return apply(j);
}

// Desc: validate and copy every known key; unknown keys are ignored
// In: const json& j
// Out: bool (true on success)
bool ConfigManager::apply(const json& j) {
    if (!j.is_object()) { std::cerr << "[ConfigManager] top level must be an object\n"; return false; }

    // cache_dir
    if (j.contains("cache_dir") && j["cache_dir"].is_string()) {
        cache_dir_ = j["cache_dir"].get<std::string>();
        if (cache_dir_.empty()) { std::cerr << "[ConfigManager] 'cache_dir' must be non-empty\n"; return false; }
    } else { std::cerr << "[ConfigManager] missing or invalid 'cache_dir'\n"; return false; }

    if (j.contains("cache_db")) {
        if (!j["cache_db"].is_string() || j["cache_db"].get<std::string>().empty()) {
            std::cerr << "[ConfigManager] 'cache_db' must be a non-empty string\n";
            return false;
        }
        cache_db_ = j["cache_db"].get<std::string>();
    }

    if (j.contains("cache_driver")) {
        if (!j["cache_driver"].is_string()) { std::cerr << "[ConfigManager] 'cache_driver' must be a string\n"; return false; }
        cache_driver_ = j["cache_driver"].get<std::string>();
    }

    if (j.contains("log_path")) {
        if (!j["log_path"].is_string()) { std::cerr << "[ConfigManager] 'log_path' must be a string\n"; return false; }
        log_path_ = j["log_path"].get<std::string>();
    }

    // autoload_realms (string or array of strings)
    autoload_realms_.clear();
    if (j.contains("autoload_realms")) {
        const auto& a = j["autoload_realms"];
        if (a.is_array()) {
            for (const auto& r : a) if (r.is_string()) autoload_realms_.push_back(r.get<std::string>());
        } else if (a.is_string()) {
            autoload_realms_.push_back(a.get<std::string>());
        } else {
            std::cerr << "[ConfigManager] 'autoload_realms' must be string or array of strings\n";
            return false;
        }
    }

    if (j.contains("default_ttl")) {
        if (!j["default_ttl"].is_number_integer() || j["default_ttl"].get<std::int64_t>() < 0) {
            std::cerr << "[ConfigManager] 'default_ttl' must be a non-negative integer\n";
            return false;
        }
        default_ttl_ = j["default_ttl"].get<std::int64_t>();
    }

    // memory_limit: "64MB" or a plain byte count
    if (j.contains("memory_limit")) {
        const auto& m = j["memory_limit"];
        if (m.is_string()) {
            try { memory_limit_ = parse_size(m.get<std::string>()); }
            catch (const std::exception& e) { std::cerr << "[ConfigManager] 'memory_limit': " << e.what() << "\n"; return false; }
        } else if (m.is_number_unsigned()) {
            memory_limit_ = m.get<std::uint64_t>();
        } else {
            std::cerr << "[ConfigManager] 'memory_limit' must be like '64MB'\n";
            return false;
        }
    }

    if (j.contains("memcached")) {
        const auto& mc = j["memcached"];
        if (!mc.is_object()) { std::cerr << "[ConfigManager] 'memcached' must be an object\n"; return false; }
        if (mc.contains("host")) {
            if (!mc["host"].is_string()) { std::cerr << "[ConfigManager] 'memcached.host' must be a string\n"; return false; }
            memcached_host_ = mc["host"].get<std::string>();
        }
        if (mc.contains("port")) {
            if (!mc["port"].is_number_integer()) { std::cerr << "[ConfigManager] 'memcached.port' must be integer\n"; return false; }
            memcached_port_ = mc["port"].get<int>();
        }
        if (mc.contains("compressed")) {
            if (!mc["compressed"].is_boolean()) { std::cerr << "[ConfigManager] 'memcached.compressed' must be boolean\n"; return false; }
            memcached_compressed_ = mc["compressed"].get<bool>();
        }
    }

    return true;
}
