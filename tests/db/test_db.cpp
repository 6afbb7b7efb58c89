// BALLOT - Database Tests
// Copyright (c) 2024 BALLOT Developers
// MIT License

#include <gtest/gtest.h>
#include "ballot/db/database.h"
#include "ballot/db/leveldb.h"
#include <filesystem>
#include <random>

using namespace ballot;
using namespace ballot::db;

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
                   ("ballot_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }
};

// ============================================================================
// Status / Slice
// ============================================================================

TEST(StatusTest, Codes) {
    EXPECT_TRUE(Status::Ok().ok());
    EXPECT_EQ(Status::Ok().ToString(), "OK");

    Status nf = Status::NotFound("k");
    EXPECT_FALSE(nf.ok());
    EXPECT_TRUE(nf.IsNotFound());
    EXPECT_EQ(nf.ToString(), "NotFound: k");

    EXPECT_TRUE(Status::Corruption().IsCorruption());
    EXPECT_TRUE(Status::IOError("disk").IsIOError());
}

TEST(SliceTest, CompareAndPrefix) {
    Slice a("abc");
    Slice b("abd");
    Slice ab("ab");

    EXPECT_LT(a.compare(b), 0);
    EXPECT_GT(a.compare(ab), 0);
    EXPECT_EQ(a.compare(Slice("abc")), 0);
    EXPECT_TRUE(a.starts_with(ab));
    EXPECT_FALSE(ab.starts_with(a));
}

TEST(SliceTest, HoldsEmbeddedZeros) {
    std::string raw("V\0\0x", 4);
    Slice s(raw);
    EXPECT_EQ(s.size(), 4u);
    EXPECT_EQ(s.ToString(), raw);
}

// ============================================================================
// MemoryDatabase
// ============================================================================

TEST(MemoryDatabaseTest, PutGetDelete) {
    MemoryDatabase db;
    EXPECT_STREQ(db.Name(), "memory");

    ASSERT_TRUE(db.Put("key1", "value1").ok());
    std::string value;
    ASSERT_TRUE(db.Get("key1", &value).ok());
    EXPECT_EQ(value, "value1");
    EXPECT_TRUE(db.Exists("key1"));

    ASSERT_TRUE(db.Delete("key1").ok());
    EXPECT_TRUE(db.Get("key1", &value).IsNotFound());
    EXPECT_FALSE(db.Exists("key1"));
}

TEST(MemoryDatabaseTest, BatchAppliesInOrder) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("gone", "x").ok());

    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("a", "2");
    batch.Delete("gone");
    EXPECT_EQ(batch.Count(), 3u);

    ASSERT_TRUE(db.Write(&batch).ok());
    std::string value;
    ASSERT_TRUE(db.Get("a", &value).ok());
    EXPECT_EQ(value, "2");
    EXPECT_FALSE(db.Exists("gone"));
    EXPECT_EQ(db.Size(), 1u);

    batch.Clear();
    EXPECT_TRUE(batch.Empty());
}

TEST(MemoryDatabaseTest, WriteFailureLeavesStoreUntouched) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("a", "1").ok());

    db.SetWriteFailure(Status::IOError("injected"));

    WriteBatch batch;
    batch.Put("a", "2");
    batch.Put("b", "3");
    Status s = db.Write(&batch);
    EXPECT_TRUE(s.IsIOError());
    EXPECT_FALSE(db.Put("c", "4").ok());
    EXPECT_FALSE(db.Delete("a").ok());

    std::string value;
    ASSERT_TRUE(db.Get("a", &value).ok());
    EXPECT_EQ(value, "1");
    EXPECT_FALSE(db.Exists("b"));

    db.SetWriteFailure(std::nullopt);
    EXPECT_TRUE(db.Write(&batch).ok());
    EXPECT_TRUE(db.Exists("b"));
}

TEST(MemoryDatabaseTest, IteratorSeeksByPrefix) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("M", "meta").ok());
    ASSERT_TRUE(db.Put("Vb", "2").ok());
    ASSERT_TRUE(db.Put("Va", "1").ok());
    ASSERT_TRUE(db.Put("P1", "p").ok());

    auto it = db.NewIterator();
    std::vector<std::string> keys;
    for (it->Seek("V"); it->Valid() && it->key().starts_with("V"); it->Next()) {
        keys.push_back(it->key().ToString());
    }
    EXPECT_TRUE(it->status().ok());
    EXPECT_EQ(keys, (std::vector<std::string>{"Va", "Vb"}));

    it->SeekToFirst();
    ASSERT_TRUE(it->Valid());
    EXPECT_EQ(it->key().ToString(), "M");
}

TEST(MemoryDatabaseTest, IteratorSeesSnapshot) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("a", "1").ok());

    auto it = db.NewIterator();
    ASSERT_TRUE(db.Put("b", "2").ok());

    size_t count = 0;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        ++count;
    }
    EXPECT_EQ(count, 1u);
}

// ============================================================================
// Factory and Keys
// ============================================================================

TEST_F(DatabaseTest, OpenInMemory) {
    Options opts;
    opts.in_memory = true;

    auto [status, db] = OpenDatabase(testDir_ / "store", opts);
    ASSERT_TRUE(status.ok()) << status.ToString();
    ASSERT_NE(db, nullptr);
    EXPECT_STREQ(db->Name(), "memory");
}

TEST_F(DatabaseTest, OpenDefaultBackend) {
    auto [status, db] = OpenDatabase(testDir_ / "store");
    ASSERT_TRUE(status.ok()) << status.ToString();
    ASSERT_NE(db, nullptr);
    EXPECT_STREQ(db->Name(), HaveLevelDB() ? "leveldb" : "memory");

    ASSERT_TRUE(db->Put("k", "v").ok());
    std::string value;
    ASSERT_TRUE(db->Get("k", &value).ok());
    EXPECT_EQ(value, "v");
}

TEST_F(DatabaseTest, ReopenKeepsDataOnLevelDB) {
    if (!HaveLevelDB()) {
        GTEST_SKIP() << "built without LevelDB";
    }

    {
        auto [status, db] = OpenDatabase(testDir_ / "store");
        ASSERT_TRUE(status.ok()) << status.ToString();
        ASSERT_TRUE(db->Put("persist", "yes").ok());
    }

    auto [status, db] = OpenDatabase(testDir_ / "store");
    ASSERT_TRUE(status.ok()) << status.ToString();
    std::string value;
    ASSERT_TRUE(db->Get("persist", &value).ok());
    EXPECT_EQ(value, "yes");
}

TEST(KeyTest, PrefixedKeys) {
    EXPECT_EQ(MakeKey(prefix::META), "M");

    std::string pk = MakeKey(prefix::PROPOSAL, static_cast<uint32_t>(1));
    ASSERT_EQ(pk.size(), 5u);
    EXPECT_EQ(pk[0], 'P');
    EXPECT_EQ(pk[1], '\x01');

    std::string vk = MakeKey(prefix::VOTER, Identity::FromLabel("alice"));
    EXPECT_EQ(vk.size(), 1u + Identity::SIZE);
    EXPECT_EQ(vk[0], 'V');
}

TEST(KeyTest, DeserializeRejectsTrailingBytes) {
    std::string encoded = SerializeToString(static_cast<uint32_t>(42));
    uint32_t value = 0;
    ASSERT_TRUE(DeserializeFromString(encoded, value));
    EXPECT_EQ(value, 42u);

    EXPECT_FALSE(DeserializeFromString(encoded + "x", value));
    EXPECT_FALSE(DeserializeFromString(encoded.substr(0, 2), value));
}
