// main.cpp
#include "Cache.hpp"
#include "DriverRegistry.hpp"
#include "Logger.hpp"
#include "requirements.hpp"
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

void print_help() {
    std::cout << "Usage: tiercache [-c config.json] <command> [args]\n"
              << "  get|unset|isset <disk|db|mem> <realm> <id>\n"
              << "  set <disk|db|mem> <realm> <id> <json> [ttl]\n"
              << "  inc|dec <realm> <id> [delta]     Counter in the mem tier\n"
              << "  clear [all|disk|db|mem]\n"
              << "  clear-realm <realm> [all|disk|db|mem]\n"
              << "  bind <event> <realm> <id> [all|disk|db|mem]\n"
              << "  unbind <realm> [id]\n"
              << "  trigger <event>\n"
              << "  info                             Volatile tier usage\n"
              << "  drivers                          Available volatile drivers\n"
              << "  -h, --help                       Show this help message\n";
}

// Desc: CLI argument as a value; anything that is not JSON is kept as a string
// In: const std::string& arg
// Out: CacheValue
static CacheValue value_arg(const std::string& arg) {
    CacheResult v = parse_value(arg);
    return v ? *v : CacheValue(arg);
}

static bool int_arg(const std::string& arg, std::int64_t& out) {
    char* end = nullptr;
    long long n = std::strtoll(arg.c_str(), &end, 10);
    if (arg.empty() || *end != '\0') return false;
    out = static_cast<std::int64_t>(n);
    return true;
}

static int usage_error(const std::string& msg) {
    std::cerr << "[Main] " << msg << "\n";
    print_help();
    return 2;
}

// Desc: run one tier-qualified get/set/unset/isset
// In: Cache& cache, const std::string& cmd, const std::vector<std::string>& args, std::int64_t mem_ttl
// Out: int (exit code)
static int tier_command(Cache& cache, const std::string& cmd, const std::vector<std::string>& args,
                        std::int64_t mem_ttl) {
    if (args.size() < 3) return usage_error(cmd + " needs <tier> <realm> <id>");
    TierType tier;
    if (!parse_tier(args[0], tier) || tier == TierType::All) return usage_error("invalid tier: " + args[0]);
    const std::string& realm = args[1];
    const std::string& id = args[2];

    if (cmd == "get") {
        CacheResult v;
        if (tier == TierType::Disk) v = cache.disk_get(id, realm);
        else if (tier == TierType::Db) v = cache.db_get(id, realm);
        else v = cache.mem_get(id, realm);
        if (!v) {
            std::cerr << "not found\n";
            return 1;
        }
        std::cout << serialize_value(*v) << "\n";
        return 0;
    }
    if (cmd == "set") {
        if (args.size() < 4) return usage_error("set needs a value");
        const CacheValue data = value_arg(args[3]);
        std::int64_t ttl = tier == TierType::Memory ? mem_ttl : 0;
        if (args.size() > 4 && !int_arg(args[4], ttl)) return usage_error("invalid ttl: " + args[4]);
        bool ok;
        if (tier == TierType::Disk) ok = cache.disk_set(id, data, realm);
        else if (tier == TierType::Db) ok = cache.db_set(id, data, realm, ttl);
        else ok = cache.mem_set(id, data, realm, ttl);
        return ok ? 0 : 1;
    }
    bool hit;
    if (cmd == "unset") {
        if (tier == TierType::Disk) hit = cache.disk_unset(id, realm);
        else if (tier == TierType::Db) hit = cache.db_unset(id, realm);
        else hit = cache.mem_unset(id, realm);
    } else {
        if (tier == TierType::Disk) hit = cache.disk_isset(id, realm);
        else if (tier == TierType::Db) hit = cache.db_isset(id, realm);
        else hit = cache.mem_isset(id, realm);
    }
    std::cout << (hit ? "true" : "false") << "\n";
    return hit ? 0 : 1;
}

static int run_command(Cache& cache, const DriverRegistry& drivers, const ConfigManager& cfg,
                       const std::string& cmd, const std::vector<std::string>& args) {
    if (cmd == "get" || cmd == "set" || cmd == "unset" || cmd == "isset") {
        return tier_command(cache, cmd, args, cfg.getDefaultTtl());
    }
    if (cmd == "inc" || cmd == "dec") {
        if (args.size() < 2) return usage_error(cmd + " needs <realm> <id>");
        std::int64_t delta = 1;
        if (args.size() > 2 && !int_arg(args[2], delta)) return usage_error("invalid delta: " + args[2]);
        const std::int64_t v = cmd == "inc" ? cache.mem_inc(args[1], args[0], delta)
                                            : cache.mem_dec(args[1], args[0], delta);
        std::cout << v << "\n";
        return 0;
    }
    if (cmd == "clear") {
        TierType tier = TierType::All;
        if (!args.empty() && !parse_tier(args[0], tier)) return usage_error("invalid tier: " + args[0]);
        return cache.clear(tier) ? 0 : 1;
    }
    if (cmd == "clear-realm") {
        if (args.empty()) return usage_error("clear-realm needs <realm>");
        TierType tier = TierType::All;
        if (args.size() > 1 && !parse_tier(args[1], tier)) return usage_error("invalid tier: " + args[1]);
        return cache.clear_realm(args[0], tier) ? 0 : 1;
    }
    if (cmd == "bind") {
        if (args.size() < 3) return usage_error("bind needs <event> <realm> <id>");
        TierType tier = TierType::All;
        if (args.size() > 3 && !parse_tier(args[3], tier)) return usage_error("invalid tier: " + args[3]);
        return cache.bind(args[0], args[2], args[1], tier) ? 0 : 1;
    }
    if (cmd == "unbind") {
        if (args.empty()) return usage_error("unbind needs <realm>");
        std::cout << cache.unbind(args[0], args.size() > 1 ? args[1] : "") << "\n";
        return 0;
    }
    if (cmd == "trigger") {
        if (args.empty()) return usage_error("trigger needs <event>");
        const std::size_t n = cache.trigger(args[0]);
        std::cout << n << "\n";
        return cache.last_trigger_failures() == 0 ? 0 : 1;
    }
    if (cmd == "info") {
        const UsageInfo u = cache.get_info();
        std::cout << "driver: " << (cache.mem_available() ? cache.mem_driver() : std::string("(db)")) << "\n"
                  << "available: " << u.available << "\n"
                  << "occupied: " << u.occupied << "\n"
                  << "max: " << u.max << "\n"
                  << "log: " << Logger::path() << "\n";
        return 0;
    }
    if (cmd == "drivers") {
        for (const auto& id : drivers.available_ids()) {
            std::cout << id << (id == cache.mem_driver() ? " *" : "") << "\n";
        }
        return 0;
    }
    return usage_error("unknown command: " + cmd);
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        print_help();
        return args.empty() ? 2 : 0;
    }

    std::string config_path = "./config.json";
    if (args[0] == "-c") {
        if (args.size() < 2) return usage_error("-c needs a path");
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) return usage_error("missing command");

    auto boot = Requirements::run(config_path);
    if (!boot.ok) {
        std::cerr << "[Main] aborted: " << boot.error << "\n";
        return 1;
    }

    const std::string cmd = args[0];
    args.erase(args.begin());

    try {
        DriverRegistry drivers(default_driver_probes(boot.config));
        CacheOptions opts;
        opts.cache_dir = boot.config.getCacheDir();
        opts.driver = boot.config.getCacheDriver();
        opts.autoload_realms = boot.config.getAutoloadRealms();

        Cache cache(opts, boot.db.get(), drivers);
        const int rc = run_command(cache, drivers, boot.config, cmd, args);
        cache.close();
        return rc;
    } catch (const std::exception& e) {
        Logger::error("Main", std::string("aborted: ") + e.what());
        return 1;
    }
}
