/*-------------------------------------------------------------------------
 *
 * test_path.cpp
 *      Unit tests for dotted path access.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CTestUtil.hpp"
#include "document/CPath.hpp"

namespace StrataDB
{
namespace Test
{

TEST(PathTest, SplitAndEmptySegments)
{
    EXPECT_EQ(CPath::split("a.b.c"), (vector<string>{"a", "b", "c"}));
    EXPECT_EQ(CPath::split("a"), (vector<string>{"a"}));
    EXPECT_TRUE(CPath::hasEmptySegment("a..b"));
    EXPECT_TRUE(CPath::hasEmptySegment(".a"));
    EXPECT_FALSE(CPath::hasEmptySegment("a.b"));
}

TEST(PathTest, ArrayIndex)
{
    ASSERT_TRUE(CPath::arrayIndex("0").has_value());
    EXPECT_EQ(*CPath::arrayIndex("0"), 0u);
    ASSERT_TRUE(CPath::arrayIndex("12").has_value());
    EXPECT_EQ(*CPath::arrayIndex("12"), 12u);
    EXPECT_FALSE(CPath::arrayIndex("-1").has_value());
    EXPECT_FALSE(CPath::arrayIndex("1a").has_value());
    EXPECT_FALSE(CPath::arrayIndex("").has_value());
}

TEST(PathTest, GetThroughDocumentsAndArrays)
{
    CDocument doc{
        {"a", CValue(CDocument{{"b", CValue(7)}})},
        {"arr", CValue(CArray{CValue(CDocument{{"x", CValue("first")}})})}};

    ASSERT_NE(CPath::get(doc, "a.b"), nullptr);
    EXPECT_EQ(CPath::get(doc, "a.b")->as<int32_t>(), 7);
    ASSERT_NE(CPath::get(doc, "arr.0.x"), nullptr);
    EXPECT_EQ(CPath::get(doc, "arr.0.x")->as<string>(), "first");
    EXPECT_EQ(CPath::get(doc, "arr.1.x"), nullptr);
    EXPECT_FALSE(CPath::has(doc, "a.c"));
}

TEST(PathTest, SetCreatesIntermediateDocuments)
{
    CDocument doc;

    CPath::set(doc, "a.b.c", CValue(1));
    ASSERT_TRUE(CPath::has(doc, "a.b.c"));
    EXPECT_TRUE(CPath::get(doc, "a.b")->isDocument());
}

TEST(PathTest, SetPadsArraysWithNull)
{
    CDocument doc{{"arr", CValue(CArray{CValue(1)})}};

    CPath::set(doc, "arr.3", CValue(4));

    const auto& arr = doc.get("arr")->as<CArray>();
    ASSERT_EQ(arr.size(), 4u);
    EXPECT_TRUE(arr.at(1).isNull());
    EXPECT_TRUE(arr.at(2).isNull());
    EXPECT_EQ(arr.at(3).as<int32_t>(), 4);
}

TEST(PathTest, SetIntoScalarFails)
{
    CDocument doc{{"a", CValue(5)}};

    EXPECT_TRUE(raisesCommandError([&] { CPath::set(doc, "a.b", CValue(1)); },
                                   CErrorCode::UnsuitableValueType,
                                   "Cannot create field 'b' in element "
                                   "{a: 5}"));
}

TEST(PathTest, RemoveNullsArrayElements)
{
    CDocument doc{{"arr", CValue(CArray{CValue(1), CValue(2)})},
                  {"sub", CValue(CDocument{{"k", CValue(1)}})}};

    EXPECT_TRUE(CPath::remove(doc, "arr.0"));
    EXPECT_TRUE(doc.get("arr")->as<CArray>().at(0).isNull());
    EXPECT_TRUE(CPath::remove(doc, "sub.k"));
    EXPECT_TRUE(doc.get("sub")->as<CDocument>().empty());
    EXPECT_FALSE(CPath::remove(doc, "nope.k"));
}

TEST(PathTest, Overlaps)
{
    EXPECT_TRUE(CPath::overlaps("a", "a.b"));
    EXPECT_TRUE(CPath::overlaps("a.b", "a.b"));
    EXPECT_FALSE(CPath::overlaps("a", "ab"));
    EXPECT_FALSE(CPath::overlaps("a.b", "a.c"));
}

} // namespace Test
} // namespace StrataDB
