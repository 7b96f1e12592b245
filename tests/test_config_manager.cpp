#include "test_common.hpp"
#include "ConfigManager.hpp"

#include <fstream>
#include <thread>
#include <vector>

namespace {

TEST(ConfigManagerTest, Defaults) {
    ConfigManager cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"cache_dir": "/tmp/x"})"));
    EXPECT_EQ("/tmp/x", cfg.getCacheDir());
    EXPECT_EQ("cache/cache.sqlite", cfg.getCacheDb());
    EXPECT_EQ("", cfg.getCacheDriver());
    EXPECT_EQ("logs/tiercache.log", cfg.getLogPath());
    EXPECT_TRUE(cfg.getAutoloadRealms().empty());
    EXPECT_EQ(3600, cfg.getDefaultTtl());
    EXPECT_EQ(64ULL * 1024 * 1024, cfg.getMemoryLimit());
    EXPECT_EQ("localhost", cfg.getMemcachedHost());
    EXPECT_EQ(11211, cfg.getMemcachedPort());
    EXPECT_TRUE(cfg.getMemcachedCompressed());
}

TEST(ConfigManagerTest, FullFile) {
    tiercache_test::TempDir dir;
    const std::string path = dir.sub("config.json");
    {
        std::ofstream out(path);
        out << R"({
          "cache_dir": "files",
          "cache_db": "db/c.sqlite",
          "cache_driver": "memdb",
          "autoload_realms": ["site", "users"],
          "default_ttl": 60,
          "memory_limit": "512KB",
          "memcached": {"host": "10.0.0.2", "port": 11311, "compressed": false},
          "log_path": "l/t.log"
        })";
    }
    ConfigManager cfg;
    ASSERT_TRUE(cfg.loadFromFile(path));
    EXPECT_EQ("files", cfg.getCacheDir());
    EXPECT_EQ("db/c.sqlite", cfg.getCacheDb());
    EXPECT_EQ("memdb", cfg.getCacheDriver());
    ASSERT_EQ(2U, cfg.getAutoloadRealms().size());
    EXPECT_EQ("users", cfg.getAutoloadRealms()[1]);
    EXPECT_EQ(60, cfg.getDefaultTtl());
    EXPECT_EQ(512ULL * 1024, cfg.getMemoryLimit());
    EXPECT_EQ("10.0.0.2", cfg.getMemcachedHost());
    EXPECT_EQ(11311, cfg.getMemcachedPort());
    EXPECT_FALSE(cfg.getMemcachedCompressed());
    EXPECT_EQ("l/t.log", cfg.getLogPath());
}

TEST(ConfigManagerTest, AutoloadAsString) {
    ConfigManager cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"cache_dir": "d", "autoload_realms": "site"})"));
    ASSERT_EQ(1U, cfg.getAutoloadRealms().size());
    EXPECT_EQ("site", cfg.getAutoloadRealms()[0]);
}

TEST(ConfigManagerTest, Rejects) {
    ConfigManager cfg;
    EXPECT_FALSE(cfg.loadFromString("not json"));
    EXPECT_FALSE(cfg.loadFromString("[]"));
    EXPECT_FALSE(cfg.loadFromString(R"({})"));
    EXPECT_FALSE(cfg.loadFromString(R"({"cache_dir": ""})"));
    EXPECT_FALSE(cfg.loadFromString(R"({"cache_dir": "d", "memory_limit": "lots"})"));
    EXPECT_FALSE(cfg.loadFromString(R"({"cache_dir": "d", "default_ttl": -1})"));
    EXPECT_FALSE(cfg.loadFromString(R"({"cache_dir": "d", "memcached": {"port": "x"}})"));
    EXPECT_FALSE(cfg.loadFromString(R"({"cache_dir": "d", "autoload_realms": 3})"));
    EXPECT_FALSE(cfg.loadFromFile("/nonexistent/config.json"));
}

TEST(ConfigManagerTest, ParseSize) {
    EXPECT_EQ(100ULL, ConfigManager::parse_size("100"));
    EXPECT_EQ(2048ULL, ConfigManager::parse_size("2K"));
    EXPECT_EQ(2048ULL, ConfigManager::parse_size(" 2kb "));
    EXPECT_EQ(3ULL * 1024 * 1024, ConfigManager::parse_size("3MB"));
    EXPECT_EQ(1024ULL * 1024 * 1024, ConfigManager::parse_size("1g"));
    EXPECT_THROW(ConfigManager::parse_size("1TB"), std::runtime_error);
    EXPECT_THROW(ConfigManager::parse_size("-5MB"), std::runtime_error);
    EXPECT_THROW(ConfigManager::parse_size(""), std::runtime_error);
}

TEST(RequirementsTest, SchemaIsIdempotent) {
    auto db = tiercache_test::open_db();
    ASSERT_TRUE(db);
    std::string err;
    EXPECT_TRUE(Requirements::applySchema(db.get(), err)) << err;
    EXPECT_EQ(0, tiercache_test::count_rows(db.get(), "SELECT COUNT(*) FROM cache"));
    EXPECT_EQ(0, tiercache_test::count_rows(db.get(), "SELECT COUNT(*) FROM cache_bindings"));
}

TEST(RequirementsTest, RunReportsMissingConfig) {
    tiercache_test::TempDir dir;
    StartupResult res = Requirements::run(dir.sub("missing.json"));
    EXPECT_FALSE(res.ok);
    EXPECT_FALSE(res.error.empty());
    EXPECT_FALSE(res.db);
}

TEST(RequirementsTest, RunOpensDatabase) {
    tiercache_test::TempDir dir;
    const std::string path = dir.sub("config.json");
    {
        std::ofstream out(path);
        out << "{\"cache_dir\": \"" << dir.sub("files") << "\", "
            << "\"cache_db\": \"" << dir.sub("db/cache.sqlite") << "\", "
            << "\"log_path\": \"" << dir.sub("logs/t.log") << "\"}";
    }
    StartupResult res = Requirements::run(path);
    ASSERT_TRUE(res.ok) << res.error;
    ASSERT_TRUE(res.db);
    EXPECT_EQ(0, tiercache_test::count_rows(res.db.get(), "SELECT COUNT(*) FROM cache"));
    EXPECT_FALSE(res.logs.empty());
    EXPECT_TRUE(std::filesystem::is_directory(dir.sub("files")));
    EXPECT_EQ(dir.sub("logs/t.log"), Logger::path());
}

TEST(RequirementsTest, RunRejectsTinyMemoryLimit) {
    tiercache_test::TempDir dir;
    const std::string path = dir.sub("config.json");
    {
        std::ofstream out(path);
        out << "{\"cache_dir\": \"" << dir.sub("files") << "\", "
            << "\"cache_db\": \"" << dir.sub("cache.sqlite") << "\", "
            << "\"log_path\": \"" << dir.sub("t.log") << "\", "
            << "\"memory_limit\": \"1KB\"}";
    }
    StartupResult res = Requirements::run(path);
    EXPECT_FALSE(res.ok);
    EXPECT_NE(std::string::npos, res.error.find("memory_limit"));
}

TEST(LoggerTest, ConcurrentInitAndAppend) {
    tiercache_test::TempDir dir;
    const std::string a = dir.sub("a.log");
    const std::string b = dir.sub("b-with-a-longer-name.log");
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 200; ++i) {
                Logger::init((i + t) % 2 ? a : b);
                const std::string p = Logger::path();
                EXPECT_TRUE(p == a || p == b) << p;
                Logger::log("LoggerTest", "line " + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_TRUE(std::filesystem::exists(a) || std::filesystem::exists(b));

    Logger::init("");
    const std::string kept = Logger::path();
    EXPECT_TRUE(kept == a || kept == b);
}

}  // namespace
