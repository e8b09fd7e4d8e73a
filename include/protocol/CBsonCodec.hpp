/*-------------------------------------------------------------------------
 *
 * CBsonCodec.hpp
 *      Conversion between CDocument and BSON / extended JSON.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CValue.hpp"

#include <bson/bson.h>
#include <cstdint>
#include <string>
#include <vector>

namespace StrataDB
{

/*
 * CBsonCodec
 *		Stateless translation layer over libbson. Decoding keeps duplicate
 *		keys so that the validator can reject them; encoding writes keys
 *		as given. Malformed input raises FailedToParse.
 */
class CBsonCodec
{
  public:
    static vector<uint8_t> encode(const CDocument& doc);
    static CDocument decode(const uint8_t* data, size_t size);
    static CDocument decode(const vector<uint8_t>& data);

    /* Size of the document on the wire */
    static size_t encodedSize(const CDocument& doc);

    /* Relaxed or canonical extended JSON in, relaxed extended JSON out */
    static CDocument fromJson(const string& json);
    static string toJson(const CDocument& doc);

  private:
    static void appendDocument(bson_t* out, const CDocument& doc);
    static void appendArray(bson_t* out, const CArray& arr);
    static void appendValue(bson_t* out, const string& key,
                            const CValue& value);
    static CDocument readDocument(bson_iter_t* iter);
    static CArray readArray(bson_iter_t* iter);
    static CValue readValue(const bson_iter_t* iter);
};

} // namespace StrataDB
