#pragma once
#include "CacheDriver.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

class ConfigManager;

// Capability probe for one volatile driver
struct DriverProbe {
    std::string id;
    std::function<bool()> available;
    std::function<std::unique_ptr<DynamicStore>()> create;
};

// Ordered list of volatile drivers usable on this host. Probes run once, at
// construction; the result is read-only afterwards.
class DriverRegistry {
public:
    DriverRegistry() = default;
    explicit DriverRegistry(std::vector<DriverProbe> probes);

    // Ids whose probe succeeded, in preference order
    const std::vector<std::string>& available_ids() const { return available_; }
    bool is_available(const std::string& id) const;
    bool empty() const { return available_.empty(); }

    // nullptr if id is not available or the driver fails to start
    std::unique_ptr<DynamicStore> create(const std::string& id) const;

private:
    std::vector<DriverProbe> probes_;
    std::vector<std::string> available_;
};

// memcached, memdb, process (in this order of preference)
std::vector<DriverProbe> default_driver_probes(const ConfigManager& cfg);
