/*-------------------------------------------------------------------------
 *
 * test_sort.cpp
 *      Unit tests for sort specifications.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CTestUtil.hpp"
#include "query/CSort.hpp"

namespace StrataDB
{
namespace Test
{

namespace
{

vector<int32_t>
ids(const vector<CDocument>& docs)
{
    vector<int32_t> out;

    for (const auto& doc : docs)
        out.push_back(doc.get("_id")->as<int32_t>());
    return out;
}

} // namespace

class SortTest : public ::testing::Test
{
  protected:
    vector<CDocument> docs{
        CDocument{{"_id", CValue(1)}, {"v", CValue(3)}, {"g", CValue("b")}},
        CDocument{{"_id", CValue(2)}, {"v", CValue(1.5)}, {"g", CValue("a")}},
        CDocument{{"_id", CValue(3)}, {"g", CValue("b")}},
        CDocument{{"_id", CValue(4)},
                  {"v", CValue(CArray{CValue(0), CValue(9)})},
                  {"g", CValue("a")}}};
};

TEST_F(SortTest, Ascending)
{
    CSort(CDocument{{"v", CValue(1)}}).apply(docs);

    /* missing sorts as null; arrays by their smallest element */
    EXPECT_EQ(ids(docs), (vector<int32_t>{3, 4, 2, 1}));
}

TEST_F(SortTest, Descending)
{
    CSort(CDocument{{"v", CValue(-1.0)}}).apply(docs);

    EXPECT_EQ(ids(docs), (vector<int32_t>{4, 1, 2, 3}));
}

TEST_F(SortTest, CompoundKeysAndStability)
{
    CSort(CDocument{{"g", CValue(1)}}).apply(docs);
    EXPECT_EQ(ids(docs), (vector<int32_t>{2, 4, 1, 3}));

    CSort(CDocument{{"g", CValue(-1)}, {"_id", CValue(1)}}).apply(docs);
    EXPECT_EQ(ids(docs), (vector<int32_t>{1, 3, 2, 4}));
}

TEST_F(SortTest, EmptySpecKeepsOrder)
{
    CSort sort;

    EXPECT_TRUE(sort.empty());
    sort.apply(docs);
    EXPECT_EQ(ids(docs), (vector<int32_t>{1, 2, 3, 4}));
}

TEST_F(SortTest, InvalidSpecifications)
{
    EXPECT_TRUE(raisesCommandError(
        [] { CSort(CDocument{{"v", CValue("up")}}); },
        CErrorCode::Location15974,
        "Illegal key in $sort specification: v: \"up\""));
    EXPECT_TRUE(raisesCommandError([] { CSort(CDocument{{"v", CValue(0.5)}}); },
                                   CErrorCode::BadValue,
                                   "$sort must be a whole number"));
    EXPECT_TRUE(raisesCommandError(
        [] { CSort(CDocument{{"v", CValue(2)}}); }, CErrorCode::Location15975));
    EXPECT_TRUE(raisesCommandError(
        [] { CSort(CDocument{{"$v", CValue(1)}}); }, CErrorCode::Location16410));
}

} // namespace Test
} // namespace StrataDB
