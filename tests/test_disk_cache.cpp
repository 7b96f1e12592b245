#include "test_common.hpp"
#include "CacheKey.hpp"
#include "DiskCache.hpp"

#include <fstream>

namespace {

TEST(DiskCacheTest, RejectsMissingRoot) {
    tiercache_test::TempDir dir;
    EXPECT_THROW(DiskCache(dir.sub("nope")), std::runtime_error);
}

TEST(DiskCacheTest, RejectsFileAsRoot) {
    tiercache_test::TempDir dir;
    std::ofstream(dir.sub("plain")) << "x";
    EXPECT_THROW(DiskCache(dir.sub("plain")), std::runtime_error);
}

TEST(DiskCacheTest, StoreGetRemove) {
    tiercache_test::TempDir dir;
    DiskCache disk(dir.path());
    EXPECT_FALSE(disk.exists("a", "r"));
    EXPECT_FALSE(disk.get("a", "r").has_value());

    const CacheValue v = {{"name", "tpl"}, {"rows", {1, 2, 3}}};
    ASSERT_TRUE(disk.store("a", v, "r"));
    EXPECT_TRUE(disk.exists("a", "r"));
    auto got = disk.get("a", "r");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(v, *got);

    ASSERT_TRUE(disk.store("a", "second", "r"));
    EXPECT_EQ(CacheValue("second"), *disk.get("a", "r"));

    EXPECT_TRUE(disk.remove("a", "r"));
    EXPECT_FALSE(disk.remove("a", "r"));
    EXPECT_FALSE(disk.get("a", "r").has_value());
}

TEST(DiskCacheTest, FalsyValuesAreNotMisses) {
    tiercache_test::TempDir dir;
    DiskCache disk(dir.path());
    ASSERT_TRUE(disk.store("null", nullptr, "r"));
    ASSERT_TRUE(disk.store("zero", 0, "r"));
    ASSERT_TRUE(disk.store("empty", "", "r"));
    ASSERT_TRUE(disk.get("null", "r").has_value());
    EXPECT_TRUE(disk.get("null", "r")->is_null());
    EXPECT_EQ(CacheValue(0), *disk.get("zero", "r"));
    EXPECT_EQ(CacheValue(""), *disk.get("empty", "r"));
}

TEST(DiskCacheTest, ClearRealmKeepsOthers) {
    tiercache_test::TempDir dir;
    DiskCache disk(dir.path());
    ASSERT_TRUE(disk.store("a", 1, "r1"));
    ASSERT_TRUE(disk.store("b", 2, "r1"));
    ASSERT_TRUE(disk.store("a", 3, "r2"));

    EXPECT_TRUE(disk.clear("r1"));
    EXPECT_FALSE(disk.exists("a", "r1"));
    EXPECT_FALSE(disk.exists("b", "r1"));
    EXPECT_TRUE(disk.exists("a", "r2"));

    EXPECT_TRUE(disk.clear("never-written"));
    EXPECT_TRUE(disk.clear(""));
    EXPECT_FALSE(disk.exists("a", "r2"));
}

TEST(DiskCacheTest, UnsafeNamesAreHashed) {
    tiercache_test::TempDir dir;
    DiskCache disk(dir.path());
    ASSERT_TRUE(disk.store("../escape", "x", "a/b"));
    EXPECT_EQ(CacheValue("x"), *disk.get("../escape", "a/b"));
    EXPECT_TRUE(std::filesystem::exists(
        dir.path() + "/" + sha256_hex("a/b") + "/" + sha256_hex("../escape")));
    EXPECT_FALSE(std::filesystem::exists(dir.path() + "/escape"));
}

TEST(DiskCacheTest, CorruptFileIsAMiss) {
    tiercache_test::TempDir dir;
    DiskCache disk(dir.path());
    ASSERT_TRUE(disk.store("a", 1, "r"));
    std::ofstream(dir.path() + "/r/a", std::ios::trunc) << "{not json";
    EXPECT_FALSE(disk.get("a", "r").has_value());
}

TEST(CacheKeyTest, Helpers) {
    EXPECT_EQ("cot/x", flat_key("x", "cot"));
    EXPECT_EQ("cot/", realm_prefix("cot"));
    EXPECT_NE(flat_key("x", "a/b"), flat_key("b/x", "a"));
    EXPECT_NE(0U, flat_key("y", "a/b").find(realm_prefix("a")));
    EXPECT_EQ(sha256_hex("a/b") + "/x", flat_key("x", "a/b"));
    EXPECT_EQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", sha256_hex(""));
    EXPECT_EQ("plain-name_1.txt", safe_file_name("plain-name_1.txt"));
    EXPECT_EQ(64U, safe_file_name(".hidden").size());
    EXPECT_EQ(64U, safe_file_name(std::string(200, 'a')).size());
    EXPECT_EQ(64U, safe_file_name("").size());
}

}  // namespace
