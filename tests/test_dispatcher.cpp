/*-------------------------------------------------------------------------
 *
 * test_dispatcher.cpp
 *      End-to-end tests of commands routed through the dispatcher.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CTestUtil.hpp"
#include "protocol/CCommandDispatcher.hpp"
#include "storage/CMemoryStorage.hpp"

#include <atomic>
#include <cmath>
#include <limits>
#include <memory>
#include <thread>

namespace StrataDB
{
namespace Test
{

class DispatcherTest : public ::testing::Test
{
  protected:
    std::unique_ptr<CCommandDispatcher> dispatcher;

    void SetUp() override
    {
        CServerConfig config;

        config.workerThreads = 2;
        config.scanBatchSize = 2;
        dispatcher = std::make_unique<CCommandDispatcher>(
            std::make_shared<CMemoryStorage>(), config);
    }

    CDocument run(const CDocument& command)
    {
        return dispatcher->dispatch("db", command);
    }

    CDocument insert(const string& coll, CArray documents, bool ordered = true)
    {
        return run(CDocument{{"insert", CValue(coll)},
                             {"documents", CValue(std::move(documents))},
                             {"ordered", CValue(ordered)}});
    }

    CArray find(const string& coll, CDocument extra = CDocument())
    {
        CDocument command{{"find", CValue(coll)}};

        for (auto& field : extra.fields())
            command.append(field.key, std::move(field.value));

        CDocument reply = run(command);

        EXPECT_EQ(reply.get("ok")->toDouble(), 1.0);
        return reply.get("cursor")->as<CDocument>().get("firstBatch")
            ->as<CArray>();
    }

    static const CDocument& writeError(const CDocument& reply, size_t i)
    {
        return reply.get("writeErrors")->as<CArray>().at(i).as<CDocument>();
    }

    static int32_t code(const CDocument& doc)
    {
        return doc.get("code")->as<int32_t>();
    }
};

TEST_F(DispatcherTest, Ping)
{
    CDocument reply = run(CDocument{{"ping", CValue(1)}});

    EXPECT_EQ(reply.size(), 1u);
    EXPECT_EQ(reply.get("ok")->as<double>(), 1.0);
}

TEST_F(DispatcherTest, UnknownCommand)
{
    CDocument reply = run(CDocument{{"x", CValue(1)}});

    EXPECT_EQ(reply.keys(),
              (vector<string>{"ok", "code", "codeName", "errmsg"}));
    EXPECT_EQ(reply.get("ok")->as<double>(), 0.0);
    EXPECT_EQ(code(reply), 59);
    EXPECT_EQ(reply.get("codeName")->as<string>(), "CommandNotFound");
    EXPECT_EQ(reply.get("errmsg")->as<string>(), "no such command: 'x'");
}

TEST_F(DispatcherTest, InsertDuplicateFieldIsAWriteError)
{
    CDocument doc;

    doc.append("foo", CValue(1));
    doc.append("foo", CValue(2));

    CDocument reply = insert("c", CArray{CValue(std::move(doc))});

    EXPECT_EQ(reply.get("ok")->as<double>(), 1.0);
    EXPECT_EQ(reply.get("n")->as<int32_t>(), 0);
    EXPECT_EQ(writeError(reply, 0).get("index")->as<int32_t>(), 0);
    EXPECT_EQ(code(writeError(reply, 0)), 2);
    EXPECT_EQ(writeError(reply, 0).get("errmsg")->as<string>(),
              "invalid key: \"foo\" (duplicate keys are not allowed)");
}

TEST_F(DispatcherTest, OrderedInsertStopsAtFirstError)
{
    CDocument reply =
        insert("c", CArray{CValue(CDocument{{"_id", CValue(1)}}),
                           CValue(CDocument{{"_id", CValue(1)}}),
                           CValue(CDocument{{"_id", CValue(2)}})});

    EXPECT_EQ(reply.get("n")->as<int32_t>(), 1);
    EXPECT_EQ(reply.get("writeErrors")->as<CArray>().size(), 1u);
    EXPECT_EQ(writeError(reply, 0).get("index")->as<int32_t>(), 1);
    EXPECT_EQ(code(writeError(reply, 0)), 11000);
    EXPECT_EQ(find("c").size(), 1u);
}

TEST_F(DispatcherTest, UnorderedInsertContinues)
{
    CDocument reply =
        insert("c",
               CArray{CValue(CDocument{{"_id", CValue(1)}}),
                      CValue(CDocument{{"_id", CValue(1)}}),
                      CValue(CDocument{{"_id", CValue(2)}})},
               false);

    EXPECT_EQ(reply.get("n")->as<int32_t>(), 2);
    EXPECT_EQ(reply.get("writeErrors")->as<CArray>().size(), 1u);
    EXPECT_EQ(find("c").size(), 2u);
}

TEST_F(DispatcherTest, InsertGeneratesLeadingId)
{
    insert("c", CArray{CValue(CDocument{{"a", CValue(1)}, {"_id", CValue(9)}}),
                       CValue(CDocument{{"a", CValue(2)}})});

    CArray docs = find("c");

    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(docs.at(0).as<CDocument>().firstKey(), "_id");
    EXPECT_EQ(docs.at(0).as<CDocument>().get("_id")->as<int32_t>(), 9);
    EXPECT_TRUE(docs.at(1).as<CDocument>().get("_id")->is<CObjectId>());
}

TEST_F(DispatcherTest, FindFilterSortProjection)
{
    insert("c", CArray{CValue(CDocument{{"_id", CValue(1)},
                                        {"k", CValue(2)},
                                        {"a", CValue(CArray{CValue(1), CValue(2),
                                                            CValue(3)})}}),
                       CValue(CDocument{{"_id", CValue(2)},
                                        {"k", CValue(1)},
                                        {"a", CValue(CArray{CValue(4),
                                                            CValue(5)})}}),
                       CValue(CDocument{{"_id", CValue(3)}, {"k", CValue(3)}})});

    CArray docs = find(
        "c",
        CDocument{
            {"filter", CValue(CDocument{{"k", CValue(CDocument{
                                                  {"$lte", CValue(2)}})}})},
            {"sort", CValue(CDocument{{"k", CValue(1)}})},
            {"projection",
             CValue(CDocument{{"a", CValue(CDocument{{"$slice", CValue(-1)}})}})}});

    ASSERT_EQ(docs.size(), 2u);

    const CDocument& first = docs.at(0).as<CDocument>();
    const CDocument& second = docs.at(1).as<CDocument>();

    EXPECT_EQ(first.get("_id")->as<int32_t>(), 2);
    EXPECT_EQ(first.get("a")->as<CArray>().size(), 1u);
    EXPECT_EQ(first.get("a")->as<CArray>().at(0).as<int32_t>(), 5);
    EXPECT_TRUE(first.has("k"));
    EXPECT_EQ(second.get("_id")->as<int32_t>(), 1);
    EXPECT_EQ(second.get("a")->as<CArray>().at(0).as<int32_t>(), 3);
}

TEST_F(DispatcherTest, FindSkipAndLimit)
{
    CArray documents;

    for (int32_t i = 0; i < 7; i++)
        documents.push_back(CDocument{{"_id", CValue(i)}});
    insert("c", std::move(documents));

    CArray docs = find("c", CDocument{{"skip", CValue(2)},
                                      {"limit", CValue(3)}});

    ASSERT_EQ(docs.size(), 3u);
    EXPECT_EQ(docs.at(0).as<CDocument>().get("_id")->as<int32_t>(), 2);
    EXPECT_EQ(docs.at(2).as<CDocument>().get("_id")->as<int32_t>(), 4);
}

TEST_F(DispatcherTest, FindOnMissingCollectionIsEmpty)
{
    EXPECT_EQ(find("missing").size(), 0u);
}

TEST_F(DispatcherTest, InvalidFilterIsACommandError)
{
    CDocument reply = run(CDocument{
        {"find", CValue("c")},
        {"filter", CValue(CDocument{{"$bogus", CValue(1)}})}});

    EXPECT_EQ(reply.get("ok")->as<double>(), 0.0);
    EXPECT_EQ(code(reply), 2);
}

TEST_F(DispatcherTest, UpdateWithStringModifierIsAWriteError)
{
    insert("c", CArray{CValue(CDocument{{"_id", CValue(1)}})});

    CDocument reply = run(CDocument{
        {"update", CValue("c")},
        {"updates",
         CValue(CArray{CValue(CDocument{
             {"q", CValue(CDocument())},
             {"u", CValue(CDocument{{"$set", CValue("x")}})}})})}});

    EXPECT_EQ(reply.get("ok")->as<double>(), 1.0);
    EXPECT_EQ(reply.get("n")->as<int32_t>(), 0);
    EXPECT_EQ(code(writeError(reply, 0)), 9);
}

TEST_F(DispatcherTest, UpdateSetAndInc)
{
    insert("c", CArray{CValue(CDocument{{"_id", CValue(1)}, {"n", CValue(1)}}),
                       CValue(CDocument{{"_id", CValue(2)}, {"n", CValue(5)}})});

    CDocument reply = run(CDocument{
        {"update", CValue("c")},
        {"updates",
         CValue(CArray{CValue(CDocument{
             {"q", CValue(CDocument())},
             {"u", CValue(CDocument{{"$inc", CValue(CDocument{
                                                 {"n", CValue(10)}})}})},
             {"multi", CValue(true)}})})}});

    EXPECT_EQ(reply.get("n")->as<int32_t>(), 2);
    EXPECT_EQ(reply.get("nModified")->as<int32_t>(), 2);

    CArray docs = find("c");

    EXPECT_EQ(docs.at(0).as<CDocument>().get("n")->as<int32_t>(), 11);
    EXPECT_EQ(docs.at(1).as<CDocument>().get("n")->as<int32_t>(), 15);
}

TEST_F(DispatcherTest, UpsertAppliesSetOnInsert)
{
    CDocument reply = run(CDocument{
        {"update", CValue("c")},
        {"updates",
         CValue(CArray{CValue(CDocument{
             {"q", CValue(CDocument{{"_id", CValue(7)}})},
             {"u", CValue(CDocument{
                       {"$setOnInsert",
                        CValue(CDocument{
                            {"x", CValue(std::numeric_limits<double>::quiet_NaN())}})}})},
             {"upsert", CValue(true)}})})}});

    EXPECT_EQ(reply.get("ok")->as<double>(), 1.0);
    EXPECT_EQ(reply.get("n")->as<int32_t>(), 1);
    EXPECT_EQ(reply.get("nModified")->as<int32_t>(), 0);

    const CDocument& upserted =
        reply.get("upserted")->as<CArray>().at(0).as<CDocument>();

    EXPECT_EQ(upserted.get("index")->as<int32_t>(), 0);
    EXPECT_EQ(upserted.get("_id")->as<int32_t>(), 7);

    CArray docs = find("c");

    ASSERT_EQ(docs.size(), 1u);
    EXPECT_TRUE(std::isnan(docs.at(0).as<CDocument>().get("x")->as<double>()));
}

TEST_F(DispatcherTest, DeleteAndCount)
{
    insert("c", CArray{CValue(CDocument{{"_id", CValue(1)}, {"t", CValue("a")}}),
                       CValue(CDocument{{"_id", CValue(2)}, {"t", CValue("a")}}),
                       CValue(CDocument{{"_id", CValue(3)}, {"t", CValue("b")}})});

    CDocument reply = run(CDocument{
        {"delete", CValue("c")},
        {"deletes", CValue(CArray{CValue(CDocument{
                        {"q", CValue(CDocument{{"t", CValue("a")}})},
                        {"limit", CValue(0)}})})}});

    EXPECT_EQ(reply.get("n")->as<int32_t>(), 2);

    CDocument count = run(CDocument{{"count", CValue("c")}});

    EXPECT_EQ(count.get("n")->as<int32_t>(), 1);
}

TEST_F(DispatcherTest, CreateIndexesTwice)
{
    CDocument command{
        {"createIndexes", CValue("c")},
        {"indexes",
         CValue(CArray{CValue(CDocument{
             {"key", CValue(CDocument{{"v", CValue(1)}})},
             {"name", CValue("v_1")}})})}};

    CDocument first = run(command);

    EXPECT_EQ(first.get("numIndexesBefore")->as<int32_t>(), 1);
    EXPECT_EQ(first.get("numIndexesAfter")->as<int32_t>(), 2);
    EXPECT_TRUE(first.get("createdCollectionAutomatically")->as<bool>());

    CDocument second = run(command);

    EXPECT_EQ(second.get("numIndexesBefore")->as<int32_t>(), 2);
    EXPECT_EQ(second.get("numIndexesAfter")->as<int32_t>(), 2);
    EXPECT_EQ(second.get("note")->as<string>(), "all indexes already exist");
    EXPECT_FALSE(second.has("createdCollectionAutomatically"));
}

TEST_F(DispatcherTest, DropAllIndexes)
{
    run(CDocument{
        {"createIndexes", CValue("c")},
        {"indexes",
         CValue(CArray{CValue(CDocument{
                           {"key", CValue(CDocument{{"v", CValue(-1)}})},
                           {"name", CValue("v_-1")}}),
                       CValue(CDocument{
                           {"key", CValue(CDocument{{"foo", CValue(1)}})},
                           {"name", CValue("foo_1")}})})}});

    CDocument reply =
        run(CDocument{{"dropIndexes", CValue("c")}, {"index", CValue("*")}});

    EXPECT_EQ(reply.get("ok")->as<double>(), 1.0);
    EXPECT_EQ(reply.get("nIndexesWas")->as<int32_t>(), 3);

    CDocument list = run(CDocument{{"listIndexes", CValue("c")}});
    const CArray& batch =
        list.get("cursor")->as<CDocument>().get("firstBatch")->as<CArray>();

    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch.at(0).as<CDocument>().get("name")->as<string>(), "_id_");
}

TEST_F(DispatcherTest, CreateAndListCollections)
{
    EXPECT_EQ(run(CDocument{{"create", CValue("a")}}).get("ok")->as<double>(),
              1.0);
    EXPECT_EQ(run(CDocument{{"create", CValue("a")}}).get("ok")->as<double>(),
              1.0);

    CDocument reply = run(CDocument{{"listCollections", CValue(1)},
                                    {"nameOnly", CValue(true)}});
    const CArray& batch =
        reply.get("cursor")->as<CDocument>().get("firstBatch")->as<CArray>();

    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch.at(0).as<CDocument>().get("name")->as<string>(), "a");

    CDocument invalid = run(CDocument{{"create", CValue("a$b")}});

    EXPECT_EQ(code(invalid), 73);
}

TEST_F(DispatcherTest, CollStats)
{
    CDocument missing = run(CDocument{{"collStats", CValue("missing")}});

    EXPECT_EQ(code(missing), 26);

    insert("c", CArray{CValue(CDocument{{"_id", CValue(1)}})});

    CDocument reply = run(CDocument{{"collStats", CValue("c")},
                                    {"scale", CValue(2.9)}});

    EXPECT_EQ(reply.get("ok")->as<double>(), 1.0);
    EXPECT_EQ(reply.get("ns")->as<string>(), "db.c");
    EXPECT_EQ(reply.get("count")->toDouble(), 1.0);
    EXPECT_EQ(reply.get("scaleFactor")->as<int32_t>(), 2);
    EXPECT_FALSE(reply.get("capped")->as<bool>());

    CDocument badScale = run(CDocument{{"collStats", CValue("c")},
                                       {"scale", CValue(0)}});

    EXPECT_EQ(code(badScale), 51024);
}

TEST_F(DispatcherTest, ExplainFind)
{
    CDocument reply = run(CDocument{
        {"explain",
         CValue(CDocument{
             {"find", CValue("c")},
             {"filter", CValue(CDocument{{"a", CValue(1)}})}})}});

    EXPECT_EQ(reply.get("ok")->as<double>(), 1.0);

    const CDocument& planner = reply.get("queryPlanner")->as<CDocument>();

    EXPECT_EQ(planner.get("namespace")->as<string>(), "db.c");
    EXPECT_EQ(planner.get("winningPlan")
                  ->as<CDocument>()
                  .get("stage")
                  ->as<string>(),
              "COLLSCAN");
}

TEST_F(DispatcherTest, DatabaseFieldOverridesDefault)
{
    run(CDocument{{"create", CValue("c")}, {"$db", CValue("other")}});

    EXPECT_EQ(dispatcher->manager().listCollections("other").size(), 1u);
    EXPECT_EQ(dispatcher->manager().listCollections("db").size(), 0u);
}

TEST_F(DispatcherTest, CancelledTokenInterrupts)
{
    CCancellationToken token;

    token.cancel();

    CDocument reply =
        dispatcher->dispatch("db", CDocument{{"find", CValue("c")}}, token);

    EXPECT_EQ(code(reply), 11601);
    EXPECT_EQ(reply.get("codeName")->as<string>(), "Interrupted");
}

TEST_F(DispatcherTest, SubmitRunsOnThePool)
{
    std::vector<std::future<CDocument>> replies;

    for (int32_t i = 0; i < 10; i++)
        replies.push_back(dispatcher->submit(
            "db", CDocument{{"insert", CValue("c")},
                            {"documents", CValue(CArray{CValue(CDocument{
                                              {"_id", CValue(i)}})})}}));

    for (auto& reply : replies)
        EXPECT_EQ(reply.get().get("n")->as<int32_t>(), 1);
    EXPECT_EQ(find("c").size(), 10u);
}

TEST_F(DispatcherTest, ConcurrentInsertsShareOneImplicitCollection)
{
    constexpr int32_t writers = 16;
    std::vector<std::thread> threads;
    std::atomic<int32_t> inserted{0};

    for (int32_t i = 0; i < writers; i++)
    {
        threads.emplace_back([this, i, &inserted] {
            CDocument reply = insert(
                "race", CArray{CValue(CDocument{{"_id", CValue(i)}})});

            inserted += reply.get("n")->as<int32_t>();
        });
    }
    for (auto& thread : threads)
        thread.join();

    CDocument count = run(CDocument{{"count", CValue("race")}});
    CDocument list = run(CDocument{{"listCollections", CValue(1)}});

    EXPECT_EQ(inserted.load(), writers);
    EXPECT_EQ(count.get("n")->as<int32_t>(), writers);
    EXPECT_EQ(list.get("cursor")->as<CDocument>().get("firstBatch")
                  ->as<CArray>().size(),
              1u);
}

TEST_F(DispatcherTest, ConcurrentIncrementsAreNotLost)
{
    constexpr int32_t writers = 16;
    constexpr int32_t rounds = 25;
    std::vector<std::thread> threads;

    insert("counter",
           CArray{CValue(CDocument{{"_id", CValue(1)}, {"n", CValue(0)}})});

    for (int32_t i = 0; i < writers; i++)
    {
        threads.emplace_back([this] {
            CDocument update{
                {"q", CValue(CDocument{{"_id", CValue(1)}})},
                {"u", CValue(CDocument{
                          {"$inc", CValue(CDocument{{"n", CValue(1)}})}})}};

            for (int32_t r = 0; r < rounds; r++)
                run(CDocument{{"update", CValue("counter")},
                              {"updates", CValue(CArray{CValue(update)})}});
        });
    }
    for (auto& thread : threads)
        thread.join();

    CArray docs = find("counter");

    ASSERT_EQ(docs.size(), 1u);
    EXPECT_EQ(docs.at(0).as<CDocument>().get("n")->as<int32_t>(),
              writers * rounds);
}

TEST_F(DispatcherTest, DropCollection)
{
    insert("c", CArray{CValue(CDocument{{"_id", CValue(1)}})});

    CDocument reply = run(CDocument{{"drop", CValue("c")}});

    EXPECT_EQ(reply.get("ok")->as<double>(), 1.0);
    EXPECT_EQ(reply.get("nIndexesWas")->as<int32_t>(), 1);
    EXPECT_EQ(reply.get("ns")->as<string>(), "db.c");
    EXPECT_EQ(code(run(CDocument{{"drop", CValue("c")}})), 26);
}

TEST_F(DispatcherTest, DbStatsAndDataSize)
{
    insert("a", CArray{CValue(CDocument{{"_id", CValue(1)}}),
                       CValue(CDocument{{"_id", CValue(2)}})});
    insert("b", CArray{CValue(CDocument{{"_id", CValue(3)}})});

    CDocument stats = run(CDocument{{"dbStats", CValue(1)},
                                    {"freeStorage", CValue(true)}});

    EXPECT_EQ(stats.get("db")->as<string>(), "db");
    EXPECT_EQ(stats.get("collections")->as<int64_t>(), 2);
    EXPECT_EQ(stats.get("objects")->as<int64_t>(), 3);
    EXPECT_EQ(stats.get("indexes")->as<int64_t>(), 2);
    EXPECT_TRUE(stats.has("totalFreeStorageSize"));
    EXPECT_EQ(stats.get("scaleFactor")->as<int64_t>(), 1);

    CDocument size = run(CDocument{{"dataSize", CValue("db.a")}});

    EXPECT_EQ(size.get("numObjects")->toDouble(), 2.0);
    EXPECT_FALSE(size.get("estimate")->as<bool>());

    CDocument missing = run(CDocument{{"dataSize", CValue("db.none")}});

    EXPECT_EQ(missing.get("size")->toDouble(), 0.0);
    EXPECT_FALSE(missing.has("estimate"));
    EXPECT_EQ(code(run(CDocument{{"dataSize", CValue("nodot")}})), 73);
}

TEST_F(DispatcherTest, DbStatsRejectsNonBooleanFreeStorage)
{
    CDocument reply = run(CDocument{{"dbStats", CValue(1)},
                                    {"freeStorage", CValue("x")}});

    EXPECT_EQ(code(reply), 14);
    EXPECT_NE(reply.get("errmsg")->as<string>().find("dbStats.freeStorage"),
              string::npos);
    EXPECT_FALSE(run(CDocument{{"dbStats", CValue(1)},
                               {"freeStorage", CValue(0)}})
                     .has("totalFreeStorageSize"));
}

TEST_F(DispatcherTest, FindAndModifyUpdatesFirstInSortOrder)
{
    insert("c", CArray{CValue(CDocument{{"_id", CValue(1)}, {"v", CValue(5)}}),
                       CValue(CDocument{{"_id", CValue(2)}, {"v", CValue(3)}})});

    CDocument reply = run(CDocument{
        {"findAndModify", CValue("c")},
        {"query", CValue(CDocument())},
        {"sort", CValue(CDocument{{"v", CValue(1)}})},
        {"update", CValue(CDocument{
                       {"$push", CValue(CDocument{{"tags", CValue("x")}})}})},
        {"new", CValue(true)},
        {"fields", CValue(CDocument{{"tags", CValue(1)}})}});
    const CDocument& lastError = reply.get("lastErrorObject")->as<CDocument>();
    const CDocument& value = reply.get("value")->as<CDocument>();

    EXPECT_EQ(reply.get("ok")->as<double>(), 1.0);
    EXPECT_EQ(lastError.get("n")->as<int32_t>(), 1);
    EXPECT_TRUE(lastError.get("updatedExisting")->as<bool>());
    EXPECT_EQ(value.get("_id")->as<int32_t>(), 2);
    EXPECT_EQ(value.get("tags")->as<CArray>().size(), 1u);
    EXPECT_FALSE(value.has("v"));

    CDocument old = run(CDocument{
        {"findAndModify", CValue("c")},
        {"query", CValue(CDocument{{"_id", CValue(1)}})},
        {"update", CValue(CDocument{
                       {"$inc", CValue(CDocument{{"v", CValue(1)}})}})}});

    EXPECT_EQ(old.get("value")->as<CDocument>().get("v")->as<int32_t>(), 5);
    EXPECT_EQ(find("c", CDocument{{"filter", CValue(CDocument{
                                                 {"_id", CValue(1)}})}})
                  .at(0)
                  .as<CDocument>()
                  .get("v")
                  ->as<int32_t>(),
              6);
}

TEST_F(DispatcherTest, FindAndModifyRemoveAndUpsert)
{
    insert("c", CArray{CValue(CDocument{{"_id", CValue(1)}, {"v", CValue(5)}})});

    CDocument removed = run(CDocument{{"findAndModify", CValue("c")},
                                      {"query", CValue(CDocument{
                                                    {"v", CValue(5)}})},
                                      {"remove", CValue(true)}});

    EXPECT_EQ(removed.get("lastErrorObject")->as<CDocument>().get("n")
                  ->as<int32_t>(),
              1);
    EXPECT_EQ(removed.get("value")->as<CDocument>().get("_id")->as<int32_t>(),
              1);
    EXPECT_TRUE(find("c").empty());

    CDocument none = run(CDocument{{"findAndModify", CValue("c")},
                                   {"remove", CValue(true)}});

    EXPECT_TRUE(none.get("value")->isNull());

    CDocument upserted = run(CDocument{
        {"findAndModify", CValue("fresh")},
        {"query", CValue(CDocument{{"_id", CValue(7)}})},
        {"update", CValue(CDocument{
                       {"$set", CValue(CDocument{{"a", CValue(1)}})}})},
        {"upsert", CValue(true)},
        {"new", CValue(true)}});
    const CDocument& lastError =
        upserted.get("lastErrorObject")->as<CDocument>();

    EXPECT_FALSE(lastError.get("updatedExisting")->as<bool>());
    EXPECT_EQ(lastError.get("upserted")->as<int32_t>(), 7);
    EXPECT_EQ(upserted.get("value")->as<CDocument>().keys(),
              (vector<string>{"_id", "a"}));
}

TEST_F(DispatcherTest, FindAndModifyArgumentErrors)
{
    CDocument update{{"$set", CValue(CDocument{{"a", CValue(1)}})}};

    CDocument neither = run(CDocument{{"findAndModify", CValue("c")}});
    EXPECT_EQ(code(neither), 9);
    EXPECT_EQ(neither.get("errmsg")->as<string>(),
              "Either an update or remove=true must be specified");
    EXPECT_EQ(code(run(CDocument{{"findAndModify", CValue("c")},
                                 {"remove", CValue(true)},
                                 {"new", CValue(true)}})),
              9);
    EXPECT_EQ(code(run(CDocument{{"findAndModify", CValue("c")},
                                 {"remove", CValue(true)},
                                 {"update", CValue(update)}})),
              9);
    EXPECT_EQ(code(run(CDocument{{"findAndModify", CValue("c")},
                                 {"remove", CValue(true)},
                                 {"upsert", CValue(true)}})),
              9);
    EXPECT_EQ(code(run(CDocument{{"findAndModify", CValue("c")},
                                 {"update", CValue(CArray{})}})),
              238);
    EXPECT_EQ(code(run(CDocument{{"findAndModify", CValue("c")},
                                 {"update", CValue(1)}})),
              9);
    EXPECT_EQ(code(run(CDocument{{"findAndModify", CValue("c")},
                                 {"update", CValue(CDocument{
                                                {"$bogus", CValue(CDocument{})}})}})),
              9);
}

TEST_F(DispatcherTest, RegistryHoldsEveryCommand)
{
    EXPECT_EQ(dispatcher->registry().getRegisteredCommands(),
              (vector<string>{"collStats", "count", "create", "createIndexes",
                              "dataSize", "dbStats", "delete", "drop",
                              "dropIndexes", "explain", "find",
                              "findAndModify", "insert",
                              "listCollections", "listIndexes", "ping",
                              "update"}));
}

} // namespace Test
} // namespace StrataDB
