// requirements.cpp
#include "requirements.hpp"
#include "Logger.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>


// Create tables query
static const char* kSchemaSQL = R"SQL(
CREATE TABLE IF NOT EXISTS cache (
  c_name   TEXT    NOT NULL,
  c_realm  TEXT    NOT NULL,
  c_expire INTEGER NOT NULL DEFAULT 0,
  c_auto   INTEGER NOT NULL DEFAULT 1,
  c_value  BLOB,
  PRIMARY KEY (c_name, c_realm)
);

CREATE INDEX IF NOT EXISTS idx_cache_realm ON cache(c_realm);
CREATE INDEX IF NOT EXISTS idx_cache_expire ON cache(c_expire);

CREATE TABLE IF NOT EXISTS cache_bindings (
  c_event TEXT    NOT NULL,
  c_id    TEXT    NOT NULL,
  c_realm TEXT    NOT NULL,
  c_type  INTEGER NOT NULL DEFAULT 0
);

CREATE INDEX IF NOT EXISTS idx_bindings_event ON cache_bindings(c_event);
)SQL";


// Desc: append a startup line to the log file
// In: const std::string& msg
// Out: void
void Requirements::fileLog(const std::string& msg) {
    Logger::log("startup", msg);
}

// Desc: create directory (and parents) if missing and record status
// In: const std::string& path, StartupResult& out
// Out: void
void Requirements::ensureDir(const std::string& path, StartupResult& out) {
    if (path.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        out.logs.push_back("[ensureDir] failed: " + path + " (" + ec.message() + ")");
        return;
    }
    out.logs.push_back("[ensureDir] ok: " + path);
}

// Desc: load JSON config into StartupResult::config
// In: const std::string& config_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::loadConfig(const std::string& config_path, StartupResult& out) {
    if (!out.config.loadFromFile(config_path)) {
        out.error = "[config] failed to load " + config_path;
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back(std::string("[config] loaded: ") + config_path);
    return true;
}

// Desc: validate key config fields and permissions
// In: const ConfigManager& cfg, StartupResult& out
// Out: bool (true if valid)
bool Requirements::validateConfig(const ConfigManager& cfg, StartupResult& out) {
    const std::string dir = cfg.getCacheDir();
    struct stat st{};
    if (::stat(dir.c_str(), &st) == -1) {
        out.error = "[config] cache_dir not found: " + dir + " (" + std::string(::strerror(errno)) + ")";
        out.logs.push_back(out.error);
        return false;
    }
    if (!S_ISDIR(st.st_mode)) {
        out.error = "[config] cache_dir is not a directory: " + dir;
        out.logs.push_back(out.error);
        return false;
    }
    if (::access(dir.c_str(), W_OK | X_OK) != 0) {
        out.error = "[config] cache_dir is not writeable: " + dir + " (" + std::string(::strerror(errno)) + ")";
        out.logs.push_back(out.error);
        return false;
    }

    const int port = cfg.getMemcachedPort();
    if (port <= 0 || port > 65535) {
        out.error = "[config] memcached.port out of range: " + std::to_string(port);
        out.logs.push_back(out.error);
        return false;
    }

    const uint64_t max_bytes = cfg.getMemoryLimit();
    const uint64_t MIN_BYTES = 64 * 1024ULL;                              // 64KB
    const uint64_t MAX_BYTES = 1024ULL * 1024ULL * 1024ULL * 1024ULL;     // 1TB
    if (max_bytes < MIN_BYTES) {
        out.error = "[config] memory_limit too small (<64KB)";
        out.logs.push_back(out.error);
        return false;
    }
    if (max_bytes > MAX_BYTES) {
        out.error = "[config] memory_limit too large (>1TB)";
        out.logs.push_back(out.error);
        return false;
    }

    std::string realms;
    for (const auto& r : cfg.getAutoloadRealms()) realms += (realms.empty() ? "" : ",") + r;

    out.logs.push_back("[config] cache_dir: " + dir);
    out.logs.push_back("[config] cache_db: " + cfg.getCacheDb());
    out.logs.push_back("[config] cache_driver: " + (cfg.getCacheDriver().empty() ? std::string("(auto)") : cfg.getCacheDriver()));
    out.logs.push_back("[config] autoload_realms: " + realms);
    out.logs.push_back("[config] memory_limit: " + std::to_string(max_bytes) + " bytes");
    out.logs.push_back("[config] validation ok");
    return true;
}

bool Requirements::applySchema(sqlite3* db, std::string& err) {
    if (!db) { err = "no database"; return false; }
    char* msg = nullptr;
    int rc = sqlite3_exec(db, kSchemaSQL, nullptr, nullptr, &msg);
    if (rc != SQLITE_OK) {
        err = msg ? msg : sqlite3_errmsg(db);
        if (msg) sqlite3_free(msg);
        return false;
    }
    return true;
}

// Desc: open/init SQLite cache DB and apply schema
// In: const std::string& db_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::initCacheDb(const std::string& db_path, StartupResult& out) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(db_path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        out.error = std::string("[cache] sqlite open failed: ") + (raw ? sqlite3_errmsg(raw) : "unknown");
        out.logs.push_back(out.error);
        if (raw) sqlite3_close(raw);
        return false;
    }
    sqlite3_busy_timeout(raw, 5000);
    (void)sqlite3_exec(raw, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    (void)sqlite3_exec(raw, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_wal_autocheckpoint(raw, 512);

    out.db.reset(raw);

    std::string err;
    if (!applySchema(out.db.get(), err)) {
        out.error = "[cache] schema exec failed: " + err;
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back("[cache] schema ok (tables/indexes): " + db_path);
    return true;
}


// Desc: orchestrate startup: config, log target, dirs, DB; log results
// In: const std::string& config_path
// Out: StartupResult
StartupResult Requirements::run(const std::string& config_path) {
    StartupResult res;

    // 1) config load, log target, dirs
    if (!loadConfig(config_path, res)) {
        ensureDir("logs", res);
        for (auto& l : res.logs) fileLog(l);
        return res;
    }
    const ConfigManager& cfg = res.config;
    Logger::init(cfg.getLogPath());
    ensureDir(std::filesystem::path(cfg.getLogPath()).parent_path().string(), res);
    ensureDir(std::filesystem::path(cfg.getCacheDb()).parent_path().string(), res);
    ensureDir(cfg.getCacheDir(), res);

    // 2) validate
    if (!validateConfig(cfg, res)) {
        for (auto& l : res.logs) fileLog(l);
        return res;
    }

    // 3) DB init + schema
    if (!initCacheDb(cfg.getCacheDb(), res)) {
        for (auto& l : res.logs) fileLog(l);
        return res;
    }

    res.ok = true;
    for (auto& l : res.logs) fileLog(l);
    return res;
}
