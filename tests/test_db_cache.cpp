#include "test_common.hpp"
#include "DbCache.hpp"

namespace {

class DbCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = tiercache_test::open_db();
        ASSERT_TRUE(db_);
    }
    int rows(const std::string& where = "1") {
        return tiercache_test::count_rows(db_.get(), "SELECT COUNT(*) FROM cache WHERE " + where);
    }
    void exec(const std::string& sql) {
        ASSERT_EQ(SQLITE_OK, sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, nullptr)) << sql;
    }

    tiercache_test::SimClock clock_;
    tiercache_test::DbHandle db_{nullptr, [](sqlite3*) {}};
};

TEST_F(DbCacheTest, GetReturnsValueWhenPresent) {
    DbCache c(db_.get(), clock_.fn());
    ASSERT_TRUE(c.store("k", {{"a", 1}}, "r", 0));
    EXPECT_TRUE(c.exists("k", "r"));
    auto v = c.get("k", "r");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(1, (*v)["a"].get<int>());
    EXPECT_FALSE(c.get("other", "r").has_value());
}

TEST_F(DbCacheTest, TtlExpiry) {
    DbCache c(db_.get(), clock_.fn());
    ASSERT_TRUE(c.store("k", "v", "r", 10));
    clock_.advance(9);
    EXPECT_EQ(CacheValue("v"), *c.get("k", "r"));
    clock_.advance(1);
    EXPECT_FALSE(c.get("k", "r").has_value());
    EXPECT_FALSE(c.exists("k", "r"));
}

TEST_F(DbCacheTest, ZeroTtlNeverExpires) {
    DbCache c(db_.get(), clock_.fn());
    ASSERT_TRUE(c.store("k", "v", "r", 0));
    clock_.advance(100 * 365 * 86400LL);
    EXPECT_TRUE(c.get("k", "r").has_value());
    EXPECT_EQ(1, rows("c_expire = 0"));
}

TEST_F(DbCacheTest, ConstructionCollectsExpiredRows) {
    {
        DbCache c(db_.get(), clock_.fn());
        ASSERT_TRUE(c.store("short", 1, "r", 5));
        ASSERT_TRUE(c.store("long", 2, "r", 500));
        ASSERT_TRUE(c.store("forever", 3, "r", 0));
    }
    clock_.advance(60);
    DbCache c(db_.get(), clock_.fn());
    EXPECT_EQ(2, rows());
    EXPECT_EQ(0, rows("c_name = 'short'"));
    EXPECT_EQ(0, c.gc());
}

TEST_F(DbCacheTest, RemoveSemantics) {
    DbCache c(db_.get(), clock_.fn());
    ASSERT_TRUE(c.store("k", 1, "r", 0));
    EXPECT_TRUE(c.get("k", "r").has_value());
    EXPECT_TRUE(c.remove("k", "r"));
    EXPECT_FALSE(c.get("k", "r").has_value());
    EXPECT_FALSE(c.remove("k", "r"));
}

TEST_F(DbCacheTest, UpsertKeepsOneRow) {
    DbCache c(db_.get(), clock_.fn());
    ASSERT_TRUE(c.store("k", 1, "r", 0));
    ASSERT_TRUE(c.store("k", 2, "r", 0));
    EXPECT_EQ(1, rows());
    EXPECT_EQ(CacheValue(2), *c.get("k", "r"));
}

TEST_F(DbCacheTest, ClearRealm) {
    DbCache c(db_.get(), clock_.fn());
    ASSERT_TRUE(c.store("a", 1, "r1", 0));
    ASSERT_TRUE(c.store("a", 2, "r2", 0));
    ASSERT_TRUE(c.get("a", "r1").has_value());
    EXPECT_TRUE(c.clear("r1"));
    EXPECT_FALSE(c.get("a", "r1").has_value());
    EXPECT_EQ(CacheValue(2), *c.get("a", "r2"));
    EXPECT_TRUE(c.clear(""));
    EXPECT_EQ(0, rows());
}

TEST_F(DbCacheTest, Batches) {
    DbCache c(db_.get(), clock_.fn());
    ASSERT_TRUE(c.store("gone", 0, "r", 0));
    std::vector<PendingStore> stores{{"a", 1, "r", 0}, {"b", 2, "r", clock_.now() + 30}, {"a", 3, "r", 0}};
    std::vector<EntryKey> removals{{"gone", "r"}, {"never", "r"}};
    ASSERT_TRUE(c.remove_batch(removals));
    ASSERT_TRUE(c.store_batch(stores));
    EXPECT_EQ(2, rows());
    EXPECT_EQ(CacheValue(3), *c.get("a", "r"));
    EXPECT_FALSE(c.exists("gone", "r"));
    EXPECT_TRUE(c.remove_batch({}));
    EXPECT_TRUE(c.store_batch({}));
}

TEST_F(DbCacheTest, GetAllLoadsAutoloadRows) {
    DbCache c(db_.get(), clock_.fn());
    ASSERT_TRUE(c.store("cfg", {{"theme", "dark"}}, "system", 0));
    ASSERT_TRUE(c.store("menu", "m", "site", 0));
    ASSERT_TRUE(c.store("private", "p", "site", 0));
    ASSERT_TRUE(c.store("stale", "s", "site", 5));
    ASSERT_TRUE(c.store("elsewhere", "e", "other", 0));
    exec("UPDATE cache SET c_auto = 0 WHERE c_name = 'private'");
    clock_.advance(10);

    std::map<std::string, CacheValue> vars;
    EXPECT_EQ(2U, c.get_all({"system", "site"}, vars));
    ASSERT_EQ(2U, vars.size());
    EXPECT_EQ("dark", vars["cfg"]["theme"].get<std::string>());
    EXPECT_EQ(CacheValue("m"), vars["menu"]);
    EXPECT_EQ(0U, c.get_all({}, vars));
}

TEST_F(DbCacheTest, BatchWritesExpirationAsGiven) {
    DbCache c(db_.get(), clock_.fn());
    const std::int64_t at = clock_.now() + 10;
    clock_.advance(5);
    ASSERT_TRUE(c.store_batch({PendingStore{"k", 1, "r", at, true}}));
    EXPECT_EQ(1, rows("c_expire = " + std::to_string(at)));
    clock_.advance(5);
    EXPECT_FALSE(c.get("k", "r").has_value());
}

TEST_F(DbCacheTest, NonAutoloadRowsAreSkippedByGetAll) {
    DbCache c(db_.get(), clock_.fn());
    ASSERT_TRUE(c.store("small", 1, "site", 0));
    ASSERT_TRUE(c.store("large", 2, "site", 0, false));
    ASSERT_TRUE(c.store_batch({PendingStore{"batched", 3, "site", 0, false}}));
    EXPECT_EQ(2, rows("c_auto = 0"));

    std::map<std::string, CacheValue> vars;
    EXPECT_EQ(1U, c.get_all({"site"}, vars));
    EXPECT_EQ(0U, vars.count("large"));
    EXPECT_EQ(CacheValue(2), *c.get("large", "site"));

    ASSERT_TRUE(c.store("large", 4, "site", 0));
    EXPECT_EQ(1, rows("c_auto = 0"));
}

TEST_F(DbCacheTest, ComposedCounter) {
    DbCache c(db_.get(), clock_.fn());
    EXPECT_EQ(5, c.inc("n", "r", 5));
    EXPECT_EQ(3, c.dec("n", "r", 2));
    ASSERT_TRUE(c.store("text", "abc", "r", 0));
    EXPECT_EQ(1, c.inc("text", "r"));
}

TEST_F(DbCacheTest, InfoFromPages) {
    DbCache c(db_.get(), clock_.fn());
    UsageInfo info = c.get_info();
    EXPECT_GT(info.occupied, 0);
    EXPECT_GT(info.max, 0);
    EXPECT_EQ("sqlite", c.driver_id());
}

}  // namespace
