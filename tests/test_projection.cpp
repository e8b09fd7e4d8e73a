/*-------------------------------------------------------------------------
 *
 * test_projection.cpp
 *      Unit tests for inclusion, exclusion and $slice projection.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CTestUtil.hpp"
#include "query/CProjection.hpp"

#include <limits>

namespace StrataDB
{
namespace Test
{

namespace
{

CArray
numbers(int count)
{
    CArray arr;

    for (int i = 1; i <= count; ++i)
        arr.push_back(CValue(i));
    return arr;
}

vector<int32_t>
ints(const CValue& value)
{
    vector<int32_t> out;

    for (const auto& element : value.as<CArray>().values())
        out.push_back(element.as<int32_t>());
    return out;
}

} // namespace

class ProjectionTest : public ::testing::Test
{
  protected:
    CDocument doc{{"_id", CValue(1)},
                  {"a", CValue(numbers(5))},
                  {"b", CValue("keep")},
                  {"c", CValue(CDocument{{"d", CValue(1)}, {"e", CValue(2)}})}};

    vector<int32_t> slice(const CValue& arg)
    {
        CDocument spec{{"a", CValue(CDocument{{"$slice", arg}})}};

        return ints(*CProjection::project(doc, spec).get("a"));
    }
};

TEST_F(ProjectionTest, InclusionKeepsIdByDefault)
{
    CDocument out = CProjection::project(doc, CDocument{{"b", CValue(1)}});

    EXPECT_EQ(out.keys(), (vector<string>{"_id", "b"}));
}

TEST_F(ProjectionTest, InclusionCanDropId)
{
    CDocument out = CProjection::project(
        doc, CDocument{{"b", CValue(true)}, {"_id", CValue(0)}});

    EXPECT_EQ(out.keys(), (vector<string>{"b"}));
}

TEST_F(ProjectionTest, ExclusionRemovesListedFields)
{
    CDocument out = CProjection::project(
        doc, CDocument{{"a", CValue(0)}, {"c.d", CValue(false)}});

    EXPECT_EQ(out.keys(), (vector<string>{"_id", "b", "c"}));
    EXPECT_EQ(out.get("c")->as<CDocument>().keys(), (vector<string>{"e"}));
}

TEST_F(ProjectionTest, NestedInclusion)
{
    CDocument out = CProjection::project(doc, CDocument{{"c.e", CValue(1)}});

    ASSERT_TRUE(out.has("c"));
    EXPECT_EQ(out.get("c")->as<CDocument>().keys(), (vector<string>{"e"}));
}

TEST_F(ProjectionTest, MixedModesAreRejected)
{
    EXPECT_TRUE(raisesCommandError(
        [&] { CProjection(CDocument{{"a", CValue(1)}, {"b", CValue(0)}}); },
        CErrorCode::Location31253,
        "Cannot do exclusion on field b in inclusion projection"));
    EXPECT_TRUE(raisesCommandError(
        [&] { CProjection(CDocument{{"a", CValue(0)}, {"b", CValue(1)}}); },
        CErrorCode::Location31254,
        "Cannot do inclusion on field b in exclusion projection"));
}

TEST_F(ProjectionTest, SliceSingleNumber)
{
    EXPECT_EQ(slice(CValue(2)), (vector<int32_t>{1, 2}));
    EXPECT_EQ(slice(CValue(-2)), (vector<int32_t>{4, 5}));
    EXPECT_EQ(slice(CValue(0)), (vector<int32_t>{}));
    EXPECT_EQ(slice(CValue(5)), (vector<int32_t>{1, 2, 3, 4, 5}));
    EXPECT_EQ(slice(CValue(10)), (vector<int32_t>{1, 2, 3, 4, 5}));
    EXPECT_EQ(slice(CValue(-5)), (vector<int32_t>{1, 2, 3, 4, 5}));
    EXPECT_EQ(slice(CValue(-9)), (vector<int32_t>{1, 2, 3, 4, 5}));
}

TEST_F(ProjectionTest, SliceFractionsAndSpecialDoubles)
{
    EXPECT_EQ(slice(CValue(2.7)), (vector<int32_t>{1, 2}));
    EXPECT_EQ(slice(CValue(-1.5)), (vector<int32_t>{5}));
    EXPECT_EQ(slice(CValue(std::numeric_limits<double>::quiet_NaN())),
              (vector<int32_t>{}));
    EXPECT_EQ(slice(CValue(std::numeric_limits<double>::infinity())),
              (vector<int32_t>{1, 2, 3, 4, 5}));
}

TEST_F(ProjectionTest, SliceSkipLimitPair)
{
    EXPECT_EQ(slice(CValue(CArray{CValue(1), CValue(2)})),
              (vector<int32_t>{2, 3}));
    EXPECT_EQ(slice(CValue(CArray{CValue(-2), CValue(5)})),
              (vector<int32_t>{4, 5}));
    EXPECT_EQ(slice(CValue(CArray{CValue(-10), CValue(2)})),
              (vector<int32_t>{1, 2}));
    EXPECT_EQ(slice(CValue(CArray{CValue(7), CValue(2)})),
              (vector<int32_t>{}));
    EXPECT_EQ(slice(CValue(CArray{CValue(3), CValue()})),
              (vector<int32_t>{4, 5}));
}

TEST_F(ProjectionTest, SliceLeavesOtherFieldsAlone)
{
    CDocument out = CProjection::project(
        doc, CDocument{{"a", CValue(CDocument{{"$slice", CValue(1)}})}});

    EXPECT_EQ(out.keys(), (vector<string>{"_id", "a", "b", "c"}));
}

TEST_F(ProjectionTest, SliceSyntaxErrors)
{
    EXPECT_TRUE(raisesCommandError(
        [&] { CProjection::parseSlice(CValue()); }, CErrorCode::Location28667,
        "Invalid $slice syntax. The given syntax { $slice: null } did not "
        "match the find() syntax because :: Location31273: $slice only "
        "supports numbers and [skip, limit] arrays :: The given syntax did "
        "not match the expression $slice syntax. :: caused by :: Expression "
        "$slice takes at least 2 arguments, and at most 3, but 1 were passed "
        "in."));
    EXPECT_TRUE(raisesCommandError(
        [&] { CProjection::parseSlice(CValue(CArray{CValue(1)})); },
        CErrorCode::Location28667));
    EXPECT_TRUE(raisesCommandError(
        [&] { CProjection::parseSlice(CValue(CArray{})); },
        CErrorCode::Location28667));
    EXPECT_TRUE(raisesCommandError(
        [&] {
            CProjection::parseSlice(CValue(
                CArray{CValue(1), CValue(2), CValue(3), CValue(4)}));
        },
        CErrorCode::Location28667));
}

TEST_F(ProjectionTest, SliceArgumentTypeErrors)
{
    EXPECT_TRUE(raisesCommandError(
        [&] {
            CProjection::parseSlice(CValue(CArray{CValue("x"), CValue(1)}));
        },
        CErrorCode::Location28724,
        "First argument to $slice must be an array, but is of type: string"));
    EXPECT_TRUE(raisesCommandError(
        [&] {
            CProjection::parseSlice(CValue(CArray{CValue(1), CValue(-1)}));
        },
        CErrorCode::Location28724));
}

TEST_F(ProjectionTest, InvalidFieldPaths)
{
    EXPECT_TRUE(raisesCommandError(
        [&] { CProjection(CDocument{{"", CValue(1)}}); },
        CErrorCode::Location40352));
    EXPECT_TRUE(raisesCommandError(
        [&] { CProjection(CDocument{{"a..b", CValue(1)}}); },
        CErrorCode::Location15998));
    EXPECT_TRUE(raisesCommandError(
        [&] { CProjection(CDocument{{"a.$b", CValue(1)}}); },
        CErrorCode::Location16410));
}

} // namespace Test
} // namespace StrataDB
