/*-------------------------------------------------------------------------
 *
 * test_memory_storage.cpp
 *      Unit tests for the in-memory storage backend.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CTestUtil.hpp"
#include "storage/CMemoryStorage.hpp"

namespace StrataDB
{
namespace Test
{

class MemoryStorageTest : public ::testing::Test
{
  protected:
    CMemoryStorage storage;

    void SetUp() override
    {
        ASSERT_TRUE(storage.createCollection("db", "c", CCollectionOptions{}));
    }

    static CDocument withId(int32_t id)
    {
        return CDocument{{"_id", CValue(id)}, {"v", CValue(id * 10)}};
    }
};

TEST_F(MemoryStorageTest, CreateIsOnlyReportedOnce)
{
    EXPECT_FALSE(storage.createCollection("db", "c", CCollectionOptions{}));
    EXPECT_TRUE(storage.collectionExists("db", "c"));
    EXPECT_FALSE(storage.collectionExists("db", "other"));
    ASSERT_EQ(storage.listCollections("db").size(), 1u);
    EXPECT_EQ(storage.listCollections("db")[0].name, "c");
}

TEST_F(MemoryStorageTest, NewCollectionHasIdIndex)
{
    auto indexes = storage.listIndexes("db", "c");

    ASSERT_EQ(indexes.size(), 1u);
    EXPECT_EQ(indexes[0].name, "_id_");
    EXPECT_TRUE(indexes[0].unique);
    EXPECT_EQ(indexes[0].key.firstKey(), "_id");
}

TEST_F(MemoryStorageTest, ReadInBatchesInInsertionOrder)
{
    storage.insertDocuments("db", "c", {withId(3), withId(1), withId(2)});

    auto first = storage.read("db", "c", 0, 2);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].document.get("_id")->as<int32_t>(), 3);
    EXPECT_EQ(first[1].document.get("_id")->as<int32_t>(), 1);

    auto second = storage.read("db", "c", first.back().recordId, 2);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].document.get("_id")->as<int32_t>(), 2);
    EXPECT_TRUE(storage.read("db", "c", second.back().recordId, 2).empty());
    EXPECT_TRUE(storage.read("db", "missing", 0, 2).empty());
}

TEST_F(MemoryStorageTest, DuplicateIdIsRejectedAtomically)
{
    storage.insertDocuments("db", "c", {withId(1)});

    EXPECT_TRUE(raisesCommandError(
        [&] { storage.insertDocuments("db", "c", {withId(2), withId(1)}); },
        CErrorCode::DuplicateKey,
        "E11000 duplicate key error collection: db.c"));
    EXPECT_EQ(storage.collectionStats("db", "c").count, 1);

    EXPECT_TRUE(raisesCommandError(
        [&] { storage.insertDocuments("db", "c", {withId(5), withId(5)}); },
        CErrorCode::DuplicateKey));
}

TEST_F(MemoryStorageTest, InsertIntoMissingCollection)
{
    EXPECT_TRUE(raisesCommandError(
        [&] { storage.insertDocuments("db", "nope", {withId(1)}); },
        CErrorCode::NamespaceNotFound));
}

TEST_F(MemoryStorageTest, ReplaceAndDelete)
{
    storage.insertDocuments("db", "c", {withId(1), withId(2)});
    auto records = storage.read("db", "c", 0, 10);

    EXPECT_TRUE(storage.replaceDocument(
        "db", "c", records[0].recordId,
        CDocument{{"_id", CValue(1)}, {"v", CValue("new")}}));
    EXPECT_TRUE(raisesCommandError(
        [&] {
            storage.replaceDocument("db", "c", records[0].recordId,
                                    CDocument{{"_id", CValue(2)}});
        },
        CErrorCode::DuplicateKey));
    EXPECT_EQ(storage.read("db", "c", 0, 1)[0].document.get("v")->as<string>(),
              "new");

    EXPECT_EQ(storage.deleteDocuments("db", "c", {records[1].recordId, 999}),
              1u);
    EXPECT_EQ(storage.collectionStats("db", "c").count, 1);
}

TEST_F(MemoryStorageTest, UniqueSecondaryIndex)
{
    CIndexInfo byV{"v_1", CDocument{{"v", CValue(1)}}, true};

    storage.insertDocuments("db", "c", {withId(1), withId(2)});
    ASSERT_TRUE(storage.createIndex("db", "c", byV));
    EXPECT_FALSE(storage.createIndex("db", "c", byV));

    EXPECT_TRUE(raisesCommandError(
        [&] {
            storage.insertDocuments(
                "db", "c", {CDocument{{"_id", CValue(3)}, {"v", CValue(10)}}});
        },
        CErrorCode::DuplicateKey));

    EXPECT_TRUE(storage.dropIndex("db", "c", "v_1"));
    EXPECT_FALSE(storage.dropIndex("db", "c", "_id_"));
    EXPECT_EQ(storage.listIndexes("db", "c").size(), 1u);
}

TEST_F(MemoryStorageTest, CappedCollectionEvictsOldest)
{
    CCollectionOptions options;

    options.capped = true;
    options.size = 4096;
    options.max = 2;
    ASSERT_TRUE(storage.createCollection("db", "capped", options));

    storage.insertDocuments("db", "capped", {withId(1), withId(2), withId(3)});

    auto records = storage.read("db", "capped", 0, 10);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].document.get("_id")->as<int32_t>(), 2);
    EXPECT_EQ(storage.listCollections("db").size(), 2u);
}

TEST_F(MemoryStorageTest, StatsTrackSizes)
{
    storage.insertDocuments("db", "c", {withId(1), withId(2)});

    CCollectionStats stats = storage.collectionStats("db", "c");

    EXPECT_EQ(stats.count, 2);
    EXPECT_GT(stats.dataSize, 0);
    ASSERT_EQ(stats.indexSizes.size(), 1u);
    EXPECT_EQ(stats.indexSizes[0].first, "_id_");
    EXPECT_EQ(stats.indexSize, stats.indexSizes[0].second);
}

TEST_F(MemoryStorageTest, DropCollection)
{
    EXPECT_TRUE(storage.dropCollection("db", "c"));
    EXPECT_FALSE(storage.dropCollection("db", "c"));
    EXPECT_TRUE(storage.listCollections("db").empty());
}

} // namespace Test
} // namespace StrataDB
