// PrivDAO - Database Tests
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include <gtest/gtest.h>
#include "privdao/db/database.h"
#include "privdao/db/memorydb.h"
#include <filesystem>
#include <random>

using namespace privdao;
using namespace privdao::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("privdao_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    static std::vector<std::string> Keys(Database& db, const std::string& from = "") {
        std::vector<std::string> keys;
        auto it = db.NewIterator();
        if (from.empty()) {
            it->SeekToFirst();
        } else {
            it->Seek(from);
        }
        for (; it->Valid(); it->Next()) {
            keys.push_back(it->key().ToString());
        }
        return keys;
    }
};

// ============================================================================
// Slice and Key Helpers
// ============================================================================

TEST_F(DatabaseTest, SliceCompare) {
    Slice a("abc"), b("abd"), prefix("ab");
    EXPECT_LT(a.compare(b), 0);
    EXPECT_GT(b.compare(a), 0);
    EXPECT_LT(prefix.compare(a), 0);
    EXPECT_TRUE(a.starts_with(prefix));
    EXPECT_FALSE(prefix.starts_with(a));
    EXPECT_EQ(a, Slice(std::string("abc")));
}

TEST_F(DatabaseTest, PrefixedKeys) {
    EXPECT_EQ(MakeKey(prefix::PROPOSAL, "xy"), "pxy");
    EXPECT_EQ(MakeKey(prefix::META), "m");
    EXPECT_EQ(MakeKey(prefix::TOKEN_BALANCE, Slice("\0\1", 2)).size(), 3u);
}

TEST_F(DatabaseTest, StatusToString) {
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_TRUE(Status::NotFound("k").IsNotFound());
    EXPECT_NE(Status::Corruption("bad block").ToString().find("bad block"), std::string::npos);
}

// ============================================================================
// Memory Database
// ============================================================================

TEST_F(DatabaseTest, MemoryPutGetDelete) {
    std::unique_ptr<Database> db = OpenMemoryDatabase();
    std::string value;

    EXPECT_TRUE(db->Get("missing", &value).IsNotFound());
    ASSERT_TRUE(db->Put("k", "v1").ok());
    ASSERT_TRUE(db->Get("k", &value).ok());
    EXPECT_EQ(value, "v1");

    ASSERT_TRUE(db->Put("k", "v2").ok());
    ASSERT_TRUE(db->Get("k", &value).ok());
    EXPECT_EQ(value, "v2");

    ASSERT_TRUE(db->Delete("k").ok());
    EXPECT_TRUE(db->Get("k", &value).IsNotFound());
}

TEST_F(DatabaseTest, MemoryBatchAppliesInOrder) {
    std::unique_ptr<Database> db = OpenMemoryDatabase();
    ASSERT_TRUE(db->Put("gone", "x").ok());

    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", "2");
    batch.Delete("gone");
    batch.Put("a", "3");
    EXPECT_EQ(batch.Count(), 4u);
    ASSERT_TRUE(db->Write(&batch).ok());

    std::string value;
    ASSERT_TRUE(db->Get("a", &value).ok());
    EXPECT_EQ(value, "3");
    EXPECT_TRUE(db->Get("gone", &value).IsNotFound());
    EXPECT_EQ(static_cast<MemoryDatabase*>(db.get())->Size(), 2u);
}

TEST_F(DatabaseTest, MemoryIteratorIsSortedSnapshot) {
    std::unique_ptr<Database> db = OpenMemoryDatabase();
    ASSERT_TRUE(db->Put("p2", "").ok());
    ASSERT_TRUE(db->Put("d1", "").ok());
    ASSERT_TRUE(db->Put("p1", "").ok());

    auto it = db->NewIterator();
    ASSERT_TRUE(db->Put("p0", "").ok());

    std::vector<std::string> seen;
    for (it->Seek("p"); it->Valid(); it->Next()) {
        seen.push_back(it->key().ToString());
    }
    EXPECT_EQ(seen, (std::vector<std::string>{"p1", "p2"}));
    EXPECT_EQ(Keys(*db), (std::vector<std::string>{"d1", "p0", "p1", "p2"}));
}

// ============================================================================
// LevelDB
// ============================================================================

TEST_F(DatabaseTest, LevelDBPersistsAcrossReopen) {
    auto path = testDir_ / "state";
    {
        auto [status, db] = OpenDatabase(path);
        ASSERT_TRUE(status.ok()) << status.ToString();
        ASSERT_TRUE(db);

        WriteBatch batch;
        batch.Put(MakeKey(prefix::DAO, "k1"), "dao");
        batch.Put(MakeKey(prefix::PROPOSAL, "k2"), "proposal");
        ASSERT_TRUE(db->Write(&batch).ok());
    }
    {
        auto [status, db] = OpenDatabase(path);
        ASSERT_TRUE(status.ok()) << status.ToString();

        std::string value;
        ASSERT_TRUE(db->Get(MakeKey(prefix::PROPOSAL, "k2"), &value).ok());
        EXPECT_EQ(value, "proposal");
        EXPECT_EQ(Keys(*db), (std::vector<std::string>{"dk1", "pk2"}));
        EXPECT_EQ(Keys(*db, "p"), (std::vector<std::string>{"pk2"}));
    }

    ASSERT_TRUE(DestroyDatabase(path).ok());
    auto [status, db] = OpenDatabase(path);
    ASSERT_TRUE(status.ok());
    EXPECT_TRUE(Keys(*db).empty());
}

TEST_F(DatabaseTest, LevelDBErrorIfExists) {
    auto path = testDir_ / "exclusive";
    {
        auto [status, db] = OpenDatabase(path);
        ASSERT_TRUE(status.ok());
    }
    Options opts;
    opts.error_if_exists = true;
    auto [status, db] = OpenDatabase(path, opts);
    EXPECT_FALSE(status.ok());
    EXPECT_FALSE(db);
}
