#include "test_common.hpp"
#include "BindingRegistry.hpp"

namespace {

class BindingRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = tiercache_test::open_db();
        ASSERT_TRUE(db_);
    }
    int rows() { return tiercache_test::count_rows(db_.get(), "SELECT COUNT(*) FROM cache_bindings"); }

    tiercache_test::DbHandle db_{nullptr, [](sqlite3*) {}};
};

TEST_F(BindingRegistryTest, BindMarksDirtyAndLookupRebuilds) {
    BindingRegistry reg(db_.get());
    EXPECT_FALSE(reg.warm());
    ASSERT_TRUE(reg.bind(Binding{"page.edit", "menu", "site", TierType::Memory}));
    EXPECT_TRUE(reg.dirty());
    EXPECT_EQ(1, rows());

    auto found = reg.lookup("page.edit");
    EXPECT_TRUE(reg.warm());
    EXPECT_FALSE(reg.dirty());
    ASSERT_EQ(1U, found.size());
    EXPECT_EQ("menu", found[0].id);
    EXPECT_EQ("site", found[0].realm);
    EXPECT_EQ(TierType::Memory, found[0].tier);
    EXPECT_TRUE(reg.lookup("other").empty());
}

TEST_F(BindingRegistryTest, RejectsIncompleteBinding) {
    BindingRegistry reg(db_.get());
    EXPECT_FALSE(reg.bind(Binding{"", "id", "r", TierType::All}));
    EXPECT_FALSE(reg.bind(Binding{"ev", "", "r", TierType::All}));
    EXPECT_EQ(0, rows());
    EXPECT_FALSE(reg.dirty());
}

TEST_F(BindingRegistryTest, BindArray) {
    BindingRegistry reg(db_.get());
    std::vector<Binding> batch{
        {"ev", "a", "r", TierType::Disk},
        {"ev", "b", "r", TierType::Db},
        {"", "skipped", "r", TierType::All},
        {"ev2", "a", "r", TierType::All},
    };
    EXPECT_EQ(3U, reg.bind_array(batch));
    EXPECT_EQ(3, rows());
    EXPECT_TRUE(reg.dirty());
    EXPECT_EQ(2U, reg.lookup("ev").size());
    EXPECT_EQ(0U, reg.bind_array({}));
}

TEST_F(BindingRegistryTest, Unbind) {
    BindingRegistry reg(db_.get());
    ASSERT_EQ(3U, reg.bind_array({{"ev", "a", "r", TierType::All},
                                  {"ev", "b", "r", TierType::All},
                                  {"ev", "a", "r2", TierType::All}}));
    (void)reg.resync();
    EXPECT_EQ(1U, reg.unbind("r", "a"));
    EXPECT_TRUE(reg.dirty());
    EXPECT_EQ(2U, reg.lookup("ev").size());
    EXPECT_EQ(1U, reg.unbind("r"));
    EXPECT_EQ(0U, reg.unbind("r"));
    ASSERT_EQ(1U, reg.lookup("ev").size());
    EXPECT_FALSE(reg.dirty());
    EXPECT_EQ("r2", reg.lookup("ev")[0].realm);
}

TEST_F(BindingRegistryTest, MirrorBlobRoundTrip) {
    BindingRegistry writer(db_.get());
    ASSERT_TRUE(writer.bind(Binding{"ev", "a", "r", TierType::Disk}));
    ASSERT_TRUE(writer.bind(Binding{"ev", "b", "r", TierType::All}));
    const CacheValue blob = writer.resync();
    ASSERT_TRUE(blob.is_object());
    ASSERT_EQ(2U, blob["ev"].size());
    EXPECT_EQ(1, blob["ev"][0]["type"].get<int>());

    // a mirror adopted from the blob serves lookups without touching the table
    BindingRegistry reader(nullptr);
    ASSERT_TRUE(reader.load_mirror(blob));
    EXPECT_TRUE(reader.warm());
    auto found = reader.lookup("ev");
    ASSERT_EQ(2U, found.size());
    EXPECT_EQ(TierType::Disk, found[0].tier);
    EXPECT_EQ(2U, reader.size());
}

TEST_F(BindingRegistryTest, MalformedBlobIsRejected) {
    BindingRegistry reg(db_.get());
    EXPECT_FALSE(reg.load_mirror(CacheValue::array()));
    EXPECT_FALSE(reg.load_mirror({{"ev", "nope"}}));

    CacheValue row = {{"id", "a"}, {"realm", "r"}, {"type", 9}};
    CacheValue bad_tier = CacheValue::object();
    bad_tier["ev"] = CacheValue::array();
    bad_tier["ev"].push_back(row);
    EXPECT_FALSE(reg.load_mirror(bad_tier));
    EXPECT_FALSE(reg.warm());

    row["type"] = 2;
    CacheValue good = CacheValue::object();
    good["ev"] = CacheValue::array();
    good["ev"].push_back(row);
    EXPECT_TRUE(reg.load_mirror(good));
    EXPECT_TRUE(reg.warm());
    EXPECT_EQ(TierType::Db, reg.lookup("ev")[0].tier);
}

}  // namespace
