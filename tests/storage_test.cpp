#include "storage/storage.hpp"

#include <string>

#include <gtest/gtest.h>

namespace memkv {

// ── Fixture ───────────────────────────────────────────────────────────────────

class StorageTest : public ::testing::Test {
protected:
    Storage storage_;
};

// ── get() ─────────────────────────────────────────────────────────────────────

TEST_F(StorageTest, GetReturnsNulloptForMissingKey) {
    EXPECT_FALSE(storage_.get("nonexistent").has_value());
}

// ── set() / get() ─────────────────────────────────────────────────────────────

TEST_F(StorageTest, SetAndGetReturnsStoredValue) {
    storage_.set("key1", "value1");
    auto result = storage_.get("key1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "value1");
}

TEST_F(StorageTest, SetOverwritesExistingKey) {
    storage_.set("key", "first");
    storage_.set("key", "second");
    auto result = storage_.get("key");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "second");
}

TEST_F(StorageTest, SetHandlesBinaryValue) {
    const std::string value("a\0b\xff", 4);
    storage_.set("bin", value);
    auto result = storage_.get("bin");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, value);
}

TEST_F(StorageTest, SetHandlesLargeValues) {
    const std::string big(1 << 20, 'x');
    storage_.set("big", big);
    auto result = storage_.get("big");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), big.size());
}

// ── del() ─────────────────────────────────────────────────────────────────────

TEST_F(StorageTest, DelReturnsTrueForExistingKey) {
    storage_.set("k", "v");
    EXPECT_TRUE(storage_.del("k"));
}

TEST_F(StorageTest, DelReturnsFalseForMissingKey) {
    EXPECT_FALSE(storage_.del("ghost"));
}

TEST_F(StorageTest, DelMakesKeyUnavailable) {
    storage_.set("k", "v");
    storage_.del("k");
    EXPECT_FALSE(storage_.get("k").has_value());
}

// ── size() ────────────────────────────────────────────────────────────────────

TEST_F(StorageTest, SizeTracksSetAndDel) {
    EXPECT_EQ(storage_.size(), 0u);
    storage_.set("a", "1");
    storage_.set("b", "2");
    storage_.set("a", "3");
    EXPECT_EQ(storage_.size(), 2u);
    storage_.del("a");
    EXPECT_EQ(storage_.size(), 1u);
}

// ── compact() ─────────────────────────────────────────────────────────────────

TEST_F(StorageTest, CompactKeepsLiveEntries) {
    for (int i = 0; i < 2000; ++i) {
        storage_.set("key" + std::to_string(i), "value" + std::to_string(i));
    }
    for (int i = 0; i < 2000; i += 2) {
        storage_.del("key" + std::to_string(i));
    }

    storage_.compact();

    EXPECT_EQ(storage_.size(), 1000u);
    for (int i = 0; i < 2000; ++i) {
        auto result = storage_.get("key" + std::to_string(i));
        if (i % 2 == 0) {
            EXPECT_FALSE(result.has_value()) << i;
        } else {
            ASSERT_TRUE(result.has_value()) << i;
            EXPECT_EQ(*result, "value" + std::to_string(i));
        }
    }
}

TEST_F(StorageTest, CompactOnEmptyStorage) {
    storage_.compact();
    EXPECT_EQ(storage_.size(), 0u);
    storage_.set("k", "v");
    EXPECT_EQ(storage_.get("k").value_or(""), "v");
}

TEST_F(StorageTest, StorageIsUsableAfterCompact) {
    storage_.set("a", "1");
    storage_.compact();
    storage_.set("b", "2");
    storage_.set("a", "3");
    EXPECT_TRUE(storage_.del("b"));
    EXPECT_EQ(storage_.get("a").value_or(""), "3");
    EXPECT_FALSE(storage_.get("b").has_value());
}

// ── clear() ───────────────────────────────────────────────────────────────────

TEST_F(StorageTest, ClearRemovesAllEntries) {
    storage_.set("a", "1");
    storage_.set("b", "2");
    storage_.clear();
    EXPECT_EQ(storage_.size(), 0u);
    EXPECT_FALSE(storage_.get("a").has_value());
}

} // namespace memkv
