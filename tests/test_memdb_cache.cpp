#include "test_common.hpp"
#include "MemdbCache.hpp"

namespace {

class MemdbCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!MemdbCache::supported()) GTEST_SKIP() << "SQLite built without the memdb VFS";
    }
    // Distinct database per test
    std::string name() const {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        return std::string("/tiercache-test-") + info->name();
    }

    tiercache_test::SimClock clock_;
};

TEST_F(MemdbCacheTest, StoreGetExpire) {
    MemdbCache c(0, name(), clock_.fn());
    ASSERT_TRUE(c.store("k", {{"x", true}}, "r", 5));
    EXPECT_TRUE(c.exists("k", "r"));
    EXPECT_TRUE((*c.get("k", "r"))["x"].get<bool>());
    clock_.advance(5);
    EXPECT_FALSE(c.exists("k", "r"));
    EXPECT_FALSE(c.get("k", "r").has_value());
}

TEST_F(MemdbCacheTest, RemoveSemantics) {
    MemdbCache c(0, name(), clock_.fn());
    ASSERT_TRUE(c.store("k", nullptr, "r", 0));
    EXPECT_TRUE(c.get("k", "r").has_value());
    EXPECT_TRUE(c.remove("k", "r"));
    EXPECT_FALSE(c.remove("k", "r"));
}

TEST_F(MemdbCacheTest, SharedBetweenConnections) {
    MemdbCache a(0, name(), clock_.fn());
    MemdbCache b(0, name(), clock_.fn());
    ASSERT_TRUE(a.store("k", 7, "r", 0));
    EXPECT_EQ(CacheValue(7), *b.get("k", "r"));
}

TEST_F(MemdbCacheTest, ClearRealmByPrefix) {
    MemdbCache c(0, name(), clock_.fn());
    ASSERT_TRUE(c.store("a", 1, "r", 0));
    ASSERT_TRUE(c.store("a", 2, "rr", 0));
    EXPECT_TRUE(c.clear("r"));
    EXPECT_FALSE(c.exists("a", "r"));
    EXPECT_TRUE(c.exists("a", "rr"));
    EXPECT_TRUE(c.clear(""));
    EXPECT_FALSE(c.exists("a", "rr"));
}

TEST_F(MemdbCacheTest, RealmsWithSeparatorStayIsolated) {
    MemdbCache c(0, name(), clock_.fn());
    ASSERT_TRUE(c.store("x", 1, "a/b", 0));
    ASSERT_TRUE(c.store("b/x", 2, "a", 0));
    EXPECT_EQ(CacheValue(1), *c.get("x", "a/b"));
    EXPECT_EQ(CacheValue(2), *c.get("b/x", "a"));
    EXPECT_TRUE(c.clear("a"));
    EXPECT_FALSE(c.exists("b/x", "a"));
    EXPECT_TRUE(c.exists("x", "a/b"));
}

TEST_F(MemdbCacheTest, Counter) {
    MemdbCache c(0, name(), clock_.fn());
    EXPECT_EQ(5, c.inc("n", "r", 5));
    EXPECT_EQ(3, c.dec("n", "r", 2));
    EXPECT_EQ(CacheValue(3), *c.get("n", "r"));
}

TEST_F(MemdbCacheTest, SizeLimitIsReported) {
    MemdbCache c(1024 * 1024, name(), clock_.fn());
    UsageInfo info = c.get_info();
    EXPECT_GT(info.occupied, 0);
    EXPECT_GT(info.max, 0);
    EXPECT_LE(info.max, 1024 * 1024);
    EXPECT_EQ(info.max - info.occupied, info.available);
    EXPECT_EQ("memdb", c.driver_id());
}

TEST_F(MemdbCacheTest, FullDatabaseFailsStore) {
    MemdbCache c(64 * 1024, name(), clock_.fn());
    const std::string blob(4096, 'x');
    bool failed = false;
    for (int i = 0; i < 64 && !failed; ++i) {
        failed = !c.store("k" + std::to_string(i), blob, "r", 0);
    }
    EXPECT_TRUE(failed);
}

}  // namespace
