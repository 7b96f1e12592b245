#pragma once
#include "CacheTypes.hpp"
#include "Logger.hpp"
#include "requirements.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <unistd.h>
#include <sqlite3.h>

namespace tiercache_test {

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "tiercache-XXXXXX").string();
        char* p = ::mkdtemp(&tmpl[0]);
        if (p) path_ = p;
    }
    ~TempDir() {
        std::error_code ec;
        if (!path_.empty()) std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string sub(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

// Manually advanced clock
class SimClock {
public:
    explicit SimClock(std::int64_t start = 1700000000) : now_(std::make_shared<std::int64_t>(start)) {}
    NowFn fn() const {
        auto n = now_;
        return [n]() { return *n; };
    }
    void advance(std::int64_t sec) { *now_ += sec; }
    std::int64_t now() const { return *now_; }

private:
    std::shared_ptr<std::int64_t> now_;
};

using DbHandle = std::unique_ptr<sqlite3, void(*)(sqlite3*)>;

// SQLite database at path (":memory:" by default) with the cache schema applied
inline DbHandle open_db(const std::string& path = ":memory:") {
    sqlite3* raw = nullptr;
    if (sqlite3_open(path.c_str(), &raw) != SQLITE_OK) {
        if (raw) sqlite3_close(raw);
        raw = nullptr;
    }
    DbHandle db(raw, [](sqlite3* p) { if (p) sqlite3_close(p); });
    std::string err;
    if (db && !Requirements::applySchema(db.get(), err)) db.reset();
    return db;
}

inline int count_rows(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    int n = -1;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) == SQLITE_OK) {
        if (sqlite3_step(st) == SQLITE_ROW) n = sqlite3_column_int(st, 0);
    }
    sqlite3_finalize(st);
    return n;
}

// Keeps test log lines out of the working tree
class LogToTemp : public ::testing::Environment {
public:
    void SetUp() override { Logger::init(dir_.sub("test.log")); }

private:
    TempDir dir_;
};

}  // namespace tiercache_test

static ::testing::Environment* const g_log_env =
    ::testing::AddGlobalTestEnvironment(new tiercache_test::LogToTemp);
