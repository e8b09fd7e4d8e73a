/*-------------------------------------------------------------------------
 *
 * test_collection_manager.cpp
 *      Unit tests for collection and index lifecycle.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CTestUtil.hpp"
#include "catalog/CCollectionManager.hpp"
#include "storage/CMemoryStorage.hpp"

#include <atomic>
#include <memory>
#include <thread>

namespace StrataDB
{
namespace Test
{

/* Fails the build of one named index */
class CFailingIndexStorage : public CMemoryStorage
{
  public:
    explicit CFailingIndexStorage(string failing) : failing_(std::move(failing))
    {
    }

    bool createIndex(const string& db, const string& coll,
                     const CIndexInfo& index) override
    {
        if (index.name == failing_)
            throw CCommandError(CErrorCode::CannotCreateIndex, "build failed");
        return CMemoryStorage::createIndex(db, coll, index);
    }

  private:
    string failing_;
};

class CollectionManagerTest : public ::testing::Test
{
  protected:
    std::shared_ptr<CMemoryStorage> storage;
    std::unique_ptr<CCollectionManager> manager;

    void SetUp() override
    {
        storage = std::make_shared<CMemoryStorage>();
        manager = std::make_unique<CCollectionManager>(storage, CServerConfig());
    }

    static CValue indexSpec(CDocument key, const string& name)
    {
        return CValue(CDocument{{"key", CValue(std::move(key))},
                                {"name", CValue(name)}});
    }

    static CValue specs(std::initializer_list<CValue> items)
    {
        return CValue(CArray(items));
    }

    vector<string> indexNames(const string& coll)
    {
        vector<string> names;

        for (const auto& index : manager->listIndexes("db", coll))
            names.push_back(index.name);
        return names;
    }
};

TEST_F(CollectionManagerTest, CollectionNameRules)
{
    EXPECT_NO_THROW(CCollectionManager::validateCollectionName("db", "users"));
    EXPECT_NO_THROW(
        CCollectionManager::validateCollectionName("db", "system.users"));
    EXPECT_TRUE(raisesCommandError(
        [] { CCollectionManager::validateCollectionName("db", ".hidden"); },
        CErrorCode::InvalidNamespace,
        "Collection names cannot start with '.': .hidden"));
    EXPECT_TRUE(raisesCommandError(
        [] { CCollectionManager::validateCollectionName("db", "a$b"); },
        CErrorCode::InvalidNamespace, "Invalid collection name: 'db.a$b'"));
    EXPECT_TRUE(raisesCommandError(
        [] { CCollectionManager::validateCollectionName("db", ""); },
        CErrorCode::InvalidNamespace));
    EXPECT_TRUE(raisesCommandError(
        [] {
            CCollectionManager::validateCollectionName("db", string(236, 'x'));
        },
        CErrorCode::InvalidNamespace));
}

TEST_F(CollectionManagerTest, CappedOptions)
{
    CCollectionOptions options = CCollectionManager::parseCollectionOptions(
        CDocument{{"create", CValue("c")},
                  {"capped", CValue(true)},
                  {"size", CValue(1000.7)},
                  {"max", CValue(10)}});

    EXPECT_TRUE(options.capped);
    EXPECT_EQ(options.size, 1000);
    EXPECT_EQ(options.max, 10);

    EXPECT_FALSE(CCollectionManager::parseCollectionOptions(
                     CDocument{{"create", CValue("c")}, {"size", CValue(5)}})
                     .capped);
}

TEST_F(CollectionManagerTest, CappedOptionErrors)
{
    EXPECT_TRUE(raisesCommandError(
        [] {
            CCollectionManager::parseCollectionOptions(
                CDocument{{"capped", CValue(true)}});
        },
        CErrorCode::InvalidOptions,
        "the 'size' field is required when 'capped' is true"));
    EXPECT_TRUE(raisesCommandError(
        [] {
            CCollectionManager::parseCollectionOptions(
                CDocument{{"capped", CValue(true)}, {"size", CValue(-5)}});
        },
        CErrorCode::Location51024,
        "BSON field 'size' value must be >= 1, actual value '-5'"));
    EXPECT_TRUE(raisesCommandError(
        [] {
            CCollectionManager::parseCollectionOptions(
                CDocument{{"capped", CValue(true)}, {"size", CValue("big")}});
        },
        CErrorCode::TypeMismatch,
        "BSON field 'create.size' is the wrong type 'string', expected types "
        "'[long, int, decimal, double]'"));
    EXPECT_TRUE(raisesCommandError(
        [] {
            CCollectionManager::parseCollectionOptions(
                CDocument{{"capped", CValue("yes")}});
        },
        CErrorCode::TypeMismatch));
}

TEST_F(CollectionManagerTest, RepeatedCreateSucceeds)
{
    manager->createCollection("db", "c", CCollectionOptions{});
    EXPECT_NO_THROW(manager->createCollection("db", "c", CCollectionOptions{}));
    EXPECT_EQ(manager->listCollections("db").size(), 1u);
}

TEST_F(CollectionManagerTest, LegacyModeReportsNamespaceExists)
{
    CServerConfig config;

    config.legacyNamespaceExists = true;
    CCollectionManager legacy(storage, config);

    legacy.createCollection("db", "c", CCollectionOptions{});
    EXPECT_TRUE(raisesCommandError(
        [&] { legacy.createCollection("db", "c", CCollectionOptions{}); },
        CErrorCode::NamespaceExists, "Collection db.c already exists."));
}

TEST_F(CollectionManagerTest, ConcurrentCreateProducesOneCollection)
{
    constexpr int kCallers = 16;
    std::atomic<int> failures{0};
    std::atomic<int> created{0};
    vector<std::thread> threads;

    for (int i = 0; i < kCallers; ++i)
    {
        threads.emplace_back([&, i] {
            try
            {
                if (i % 2 == 0)
                    manager->createCollection("db", "race",
                                              CCollectionOptions{});
                else if (manager->ensureCollection("db", "race"))
                    created++;
            }
            catch (const CCommandError&)
            {
                failures++;
            }
        });
    }
    for (auto& thread : threads)
        thread.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_LE(created.load(), 1);
    EXPECT_EQ(manager->listCollections("db").size(), 1u);
    EXPECT_EQ(indexNames("race"), (vector<string>{"_id_"}));
}

TEST_F(CollectionManagerTest, CreateIndexesCreatesCollection)
{
    CValue request = specs({indexSpec({{"v", CValue(-1)}}, "v_-1"),
                            indexSpec({{"foo", CValue(1.0)}}, "foo_1")});
    CCreateIndexesResult result = manager->createIndexes("db", "c", &request);

    EXPECT_EQ(result.numIndexesBefore, 1);
    EXPECT_EQ(result.numIndexesAfter, 3);
    EXPECT_TRUE(result.createdCollectionAutomatically);
    EXPECT_FALSE(result.allExisted);
    EXPECT_EQ(indexNames("c"), (vector<string>{"_id_", "v_-1", "foo_1"}));

    /* directions are stored as int32 */
    EXPECT_TRUE(manager->listIndexes("db", "c")[2].key.get("foo")->is<int32_t>());
}

TEST_F(CollectionManagerTest, FailedCreateIndexesLeavesNoIndexes)
{
    manager->createCollection("db", "c", CCollectionOptions{});
    storage->insertDocuments("db", "c",
                             {CDocument{{"_id", CValue(1)}, {"v", CValue(7)}},
                              CDocument{{"_id", CValue(2)}, {"v", CValue(7)}}});

    CDocument unique{{"key", CValue(CDocument{{"v", CValue(1)}})},
                     {"name", CValue("v_1")},
                     {"unique", CValue(true)}};
    CValue request =
        specs({indexSpec({{"a", CValue(1)}}, "a_1"), CValue(unique)});

    EXPECT_TRUE(raisesCommandError(
        [&] { manager->createIndexes("db", "c", &request); },
        CErrorCode::DuplicateKey));
    EXPECT_EQ(indexNames("c"), (vector<string>{"_id_"}));
}

TEST_F(CollectionManagerTest, FailedCreateIndexesDropsImplicitCollection)
{
    auto failing = std::make_shared<CFailingIndexStorage>("b_1");
    CCollectionManager failingManager(failing, CServerConfig());
    CValue request = specs({indexSpec({{"a", CValue(1)}}, "a_1"),
                            indexSpec({{"b", CValue(1)}}, "b_1")});

    EXPECT_TRUE(raisesCommandError(
        [&] { failingManager.createIndexes("db", "fresh", &request); },
        CErrorCode::CannotCreateIndex));
    EXPECT_FALSE(failing->collectionExists("db", "fresh"));

    failing->createCollection("db", "kept", CCollectionOptions{});
    EXPECT_TRUE(raisesCommandError(
        [&] { failingManager.createIndexes("db", "kept", &request); },
        CErrorCode::CannotCreateIndex));
    EXPECT_TRUE(failing->collectionExists("db", "kept"));
    EXPECT_EQ(failing->listIndexes("db", "kept").size(), 1u);
}

TEST_F(CollectionManagerTest, NamespaceLocksAreReleased)
{
    for (int i = 0; i < 500; ++i)
    {
        string name = "tmp" + std::to_string(i);

        manager->createCollection("db", name, CCollectionOptions{});
        manager->dropCollection("db", name);
        manager->dropCollection("db", "never" + std::to_string(i));
    }
    EXPECT_LE(manager->namespaceLockCount(), 1u);

    auto held = manager->namespaceLock("db", "c");

    EXPECT_EQ(manager->namespaceLock("db", "c"), held);
    manager->dropCollection("db", "other");
    EXPECT_EQ(manager->namespaceLock("db", "c"), held);
}

TEST_F(CollectionManagerTest, IdenticalCreateIndexesIsANoOp)
{
    CValue request = specs({indexSpec({{"v", CValue(1)}}, "v_1")});

    manager->createIndexes("db", "c", &request);
    CCreateIndexesResult again = manager->createIndexes("db", "c", &request);

    EXPECT_TRUE(again.allExisted);
    EXPECT_EQ(again.numIndexesBefore, 2);
    EXPECT_EQ(again.numIndexesAfter, 2);
}

TEST_F(CollectionManagerTest, ConflictingIndexes)
{
    CValue first = specs({indexSpec({{"v", CValue(1)}}, "v_1")});
    CValue sameNameOtherKey =
        specs({indexSpec({{"v", CValue(1)}, {"w", CValue(1)}}, "v_1")});
    CValue sameKeyOtherName = specs({indexSpec({{"v", CValue(1)}}, "other")});
    CValue twiceInRequest = specs({indexSpec({{"a", CValue(1)}}, "a_1"),
                                   indexSpec({{"a", CValue(1)}}, "a_1")});

    manager->createIndexes("db", "c", &first);
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->createIndexes("db", "c", &sameNameOtherKey); },
        CErrorCode::IndexKeySpecsConflict));
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->createIndexes("db", "c", &sameKeyOtherName); },
        CErrorCode::IndexOptionsConflict,
        "Index already exists with a different name: v_1"));
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->createIndexes("db", "c", &twiceInRequest); },
        CErrorCode::IndexAlreadyExists,
        "Identical index already exists: a_1"));
}

TEST_F(CollectionManagerTest, IndexSpecValidation)
{
    CValue noName = specs({CValue(CDocument{{"key", CValue(CDocument{{"a", CValue(1)}})}})});
    CValue emptyKey = specs({indexSpec(CDocument{}, "x")});
    CValue badDirection = specs({indexSpec({{"a", CValue("text")}}, "a_text")});
    CValue twoDirection = specs({indexSpec({{"a", CValue(2)}}, "a_2")});
    CValue idDescending = specs({indexSpec({{"_id", CValue(-1)}}, "id")});
    CValue unknownOption = specs({CValue(CDocument{
        {"key", CValue(CDocument{{"a", CValue(1)}})},
        {"name", CValue("a_1")},
        {"sparse", CValue(true)}})});
    CValue notArray = CValue("x");
    CValue null;

    EXPECT_TRUE(raisesCommandError(
        [&] { manager->createIndexes("db", "c", &noName); },
        CErrorCode::FailedToParse));
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->createIndexes("db", "c", &emptyKey); },
        CErrorCode::CannotCreateIndex,
        "Must specify at least one field for the index key"));
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->createIndexes("db", "c", &badDirection); },
        CErrorCode::IndexNotFound));
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->createIndexes("db", "c", &twoDirection); },
        CErrorCode::NotImplemented));
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->createIndexes("db", "c", &idDescending); },
        CErrorCode::BadValue));
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->createIndexes("db", "c", &unknownOption); },
        CErrorCode::NotImplemented,
        "Index option \"sparse\" is not implemented yet"));
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->createIndexes("db", "c", &notArray); },
        CErrorCode::TypeMismatch));
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->createIndexes("db", "c", &null); },
        CErrorCode::Location10065));
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->createIndexes("db", "c", nullptr); },
        CErrorCode::MissingField));
    EXPECT_FALSE(storage->collectionExists("db", "c"));
}

TEST_F(CollectionManagerTest, DropIndexesWildcardKeepsIdIndex)
{
    CValue request = specs({indexSpec({{"v", CValue(-1)}}, "v_-1"),
                            indexSpec({{"foo", CValue(1)}}, "foo_1")});
    CValue all("*");

    manager->createIndexes("db", "c", &request);
    CDropIndexesResult result = manager->dropIndexes("db", "c", &all);

    EXPECT_EQ(result.nIndexesWas, 3);
    EXPECT_TRUE(result.droppedAll);
    EXPECT_EQ(indexNames("c"), (vector<string>{"_id_"}));
}

TEST_F(CollectionManagerTest, DropIndexesSelectors)
{
    CValue request = specs({indexSpec({{"a", CValue(1)}}, "a_1"),
                            indexSpec({{"b", CValue(-1)}}, "b_-1"),
                            indexSpec({{"c", CValue(1)}}, "c_1"),
                            indexSpec({{"d", CValue(1)}}, "d_1")});
    CValue byName("a_1");
    CValue byKey(CDocument{{"b", CValue(-1.0)}});
    CValue byList(CArray{CValue("c_1"), CValue(CDocument{{"d", CValue(1)}})});

    manager->createIndexes("db", "c", &request);
    manager->dropIndexes("db", "c", &byName);
    manager->dropIndexes("db", "c", &byKey);
    manager->dropIndexes("db", "c", &byList);

    EXPECT_EQ(indexNames("c"), (vector<string>{"_id_"}));
}

TEST_F(CollectionManagerTest, DropIndexesErrors)
{
    CValue idName("_id_");
    CValue idKey(CDocument{{"_id", CValue(1)}});
    CValue unknown("***");
    CValue unknownKey(CDocument{{"zz", CValue(1)}});
    CValue wrongType(5);

    manager->createCollection("db", "c", CCollectionOptions{});
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->dropIndexes("db", "c", &idName); },
        CErrorCode::InvalidOptions, "cannot drop _id index"));
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->dropIndexes("db", "c", &idKey); },
        CErrorCode::InvalidOptions));
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->dropIndexes("db", "c", &unknown); },
        CErrorCode::IndexNotFound, "index not found with name [***]"));
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->dropIndexes("db", "c", &unknownKey); },
        CErrorCode::IndexNotFound, "can't find index with key: { zz: 1 }"));
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->dropIndexes("db", "c", &wrongType); },
        CErrorCode::TypeMismatch));
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->dropIndexes("db", "missing", &unknown); },
        CErrorCode::NamespaceNotFound, "ns not found db.missing"));
}

TEST_F(CollectionManagerTest, ListIndexesOnMissingCollection)
{
    EXPECT_TRUE(raisesCommandError(
        [&] { manager->listIndexes("db", "missing"); },
        CErrorCode::NamespaceNotFound, "ns does not exist: db.missing"));
}

TEST_F(CollectionManagerTest, DropCollection)
{
    manager->createCollection("db", "c", CCollectionOptions{});

    EXPECT_TRUE(manager->dropCollection("db", "c"));
    EXPECT_FALSE(manager->dropCollection("db", "c"));
}

} // namespace Test
} // namespace StrataDB
