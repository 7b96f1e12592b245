#include "DriverRegistry.hpp"
#include "ConfigManager.hpp"
#include "Logger.hpp"
#include "MemcachedCache.hpp"
#include "MemdbCache.hpp"
#include "ProcessCache.hpp"

#include <algorithm>
#include <exception>
#include <utility>

// Desc: run every probe once and keep the ids that report available
// In: std::vector<DriverProbe> probes
// Out: (constructor)
DriverRegistry::DriverRegistry(std::vector<DriverProbe> probes) : probes_(std::move(probes)) {
    for (const auto& p : probes_) {
        bool ok = false;
        try {
            ok = p.available && p.available();
        } catch (const std::exception& e) {
            Logger::error("DriverRegistry", "probe " + p.id + " failed: " + e.what());
        }
        if (ok && !is_available(p.id)) {
            available_.push_back(p.id);
        }
        Logger::log("DriverRegistry", p.id + (ok ? " available" : " unavailable"));
    }
}

bool DriverRegistry::is_available(const std::string& id) const {
    return std::find(available_.begin(), available_.end(), id) != available_.end();
}

std::unique_ptr<DynamicStore> DriverRegistry::create(const std::string& id) const {
    if (!is_available(id)) return nullptr;
    for (const auto& p : probes_) {
        if (p.id != id || !p.create) continue;
        try {
            return p.create();
        } catch (const std::exception& e) {
            Logger::error("DriverRegistry", "driver " + id + " failed to start: " + e.what());
            return nullptr;
        }
    }
    return nullptr;
}

std::vector<DriverProbe> default_driver_probes(const ConfigManager& cfg) {
    std::vector<DriverProbe> probes;

    MemcachedOptions mc;
    mc.host = cfg.getMemcachedHost();
    mc.port = cfg.getMemcachedPort();
    mc.compressed = cfg.getMemcachedCompressed();
    probes.push_back(DriverProbe{
        "memcached",
        [mc]() { return MemcachedCache::reachable(mc); },
        [mc]() -> std::unique_ptr<DynamicStore> { return std::make_unique<MemcachedCache>(mc); }
    });

    const std::uint64_t limit = cfg.getMemoryLimit();
    probes.push_back(DriverProbe{
        "memdb",
        []() { return MemdbCache::supported(); },
        [limit]() -> std::unique_ptr<DynamicStore> { return std::make_unique<MemdbCache>(limit); }
    });

    probes.push_back(DriverProbe{
        "process",
        []() { return true; },
        [limit]() -> std::unique_ptr<DynamicStore> { return std::make_unique<ProcessCache>(limit); }
    });
    return probes;
}
