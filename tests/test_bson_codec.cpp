/*-------------------------------------------------------------------------
 *
 * test_bson_codec.cpp
 *      Unit tests for the libbson translation layer.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CTestUtil.hpp"
#include "document/CValueCompare.hpp"
#include "protocol/CBsonCodec.hpp"

namespace StrataDB
{
namespace Test
{

TEST(BsonCodecTest, KeepsKindsAndOrder)
{
    CObjectId oid = CObjectId::generate();
    CDocument doc{{"_id", CValue(oid)},
                  {"i", CValue(int32_t{1})},
                  {"l", CValue(int64_t{1} << 40)},
                  {"d", CValue(2.5)},
                  {"s", CValue("text")},
                  {"b", CValue(true)},
                  {"n", CValue()},
                  {"t", CValue(CDateTime{1700000000000})},
                  {"r", CValue(CRegex{"^a", "i"})},
                  {"arr", CValue(CArray{CValue(1), CValue("two")})},
                  {"sub", CValue(CDocument{{"k", CValue(1)}})}};

    vector<uint8_t> wire = CBsonCodec::encode(doc);
    CDocument decoded = CBsonCodec::decode(wire);

    EXPECT_EQ(wire.size(), CBsonCodec::encodedSize(doc));
    EXPECT_TRUE(identical(doc, decoded));
    EXPECT_EQ(decoded.keys(), doc.keys());
}

TEST(BsonCodecTest, DecodeKeepsDuplicateKeys)
{
    CDocument doc;

    doc.append("foo", CValue("bar"));
    doc.append("foo", CValue("baz"));

    CDocument decoded = CBsonCodec::decode(CBsonCodec::encode(doc));

    ASSERT_EQ(decoded.size(), 2u);
    EXPECT_EQ(decoded.fields()[1].value.as<string>(), "baz");
}

TEST(BsonCodecTest, RejectsMalformedInput)
{
    vector<uint8_t> garbage{0x05, 0x00, 0x00};

    EXPECT_TRUE(raisesCommandError([&] { CBsonCodec::decode(garbage); },
                                   CErrorCode::FailedToParse));
    EXPECT_TRUE(raisesCommandError(
        [] { CBsonCodec::fromJson("{ not json"); }, CErrorCode::FailedToParse));
}

TEST(BsonCodecTest, JsonInput)
{
    CDocument doc = CBsonCodec::fromJson(
        R"({"insert": "users", "documents": [{"_id": "a", "n": 1.5}], )"
        R"("ordered": true})");

    EXPECT_EQ(doc.firstKey(), "insert");
    ASSERT_TRUE(doc.get("documents")->isArray());

    const auto& first = doc.get("documents")->as<CArray>().at(0);
    EXPECT_EQ(first.as<CDocument>().get("_id")->as<string>(), "a");
    EXPECT_DOUBLE_EQ(first.as<CDocument>().get("n")->as<double>(), 1.5);
    EXPECT_TRUE(doc.get("ordered")->as<bool>());
}

TEST(BsonCodecTest, JsonOutputParsesBack)
{
    CDocument doc{{"ok", CValue(1.0)},
                  {"n", CValue(3)},
                  {"msg", CValue("done")}};
    CDocument parsed = CBsonCodec::fromJson(CBsonCodec::toJson(doc));

    EXPECT_EQ(parsed.keys(), doc.keys());
    EXPECT_TRUE(valuesEqual(*parsed.get("n"), CValue(3)));
    EXPECT_EQ(parsed.get("msg")->as<string>(), "done");
}

} // namespace Test
} // namespace StrataDB
