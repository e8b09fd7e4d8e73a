/*-------------------------------------------------------------------------
 *
 * CBsonCodec.cpp
 *      Conversion between CDocument and BSON / extended JSON.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "protocol/CBsonCodec.hpp"

#include "errors/CCommandError.hpp"
#include "errors/CErrorMessages.hpp"

#include <cstring>
#include <memory>

namespace StrataDB
{

namespace
{

struct CBsonDeleter
{
    void operator()(bson_t* bson) const noexcept
    {
        bson_destroy(bson);
    }
};

using CBsonPtr = std::unique_ptr<bson_t, CBsonDeleter>;

[[noreturn]] void
appendFailed(const string& key)
{
    throw CCommandError(CErrorCode::FailedToParse,
                        CErrorMessages::invalidBson("cannot append field \"" +
                                                    key + "\""));
}

CBsonPtr
build(const CDocument& doc, void (*append)(bson_t*, const CDocument&))
{
    CBsonPtr bson(bson_new());

    append(bson.get(), doc);
    return bson;
}

} // namespace

vector<uint8_t>
CBsonCodec::encode(const CDocument& doc)
{
    CBsonPtr bson = build(doc, &CBsonCodec::appendDocument);
    const uint8_t* data = bson_get_data(bson.get());

    return vector<uint8_t>(data, data + bson->len);
}

size_t
CBsonCodec::encodedSize(const CDocument& doc)
{
    CBsonPtr bson = build(doc, &CBsonCodec::appendDocument);

    return bson->len;
}

CDocument
CBsonCodec::decode(const vector<uint8_t>& data)
{
    return decode(data.data(), data.size());
}

CDocument
CBsonCodec::decode(const uint8_t* data, size_t size)
{
    bson_t bson;
    bson_iter_t iter;
    size_t offset = 0;

    if (!bson_init_static(&bson, data, size))
        throw CCommandError(CErrorCode::FailedToParse,
                            CErrorMessages::invalidBson("malformed document"));
    if (!bson_validate(&bson, BSON_VALIDATE_NONE, &offset))
        throw CCommandError(CErrorCode::FailedToParse,
                            CErrorMessages::invalidBson(
                                "corrupt element at offset " +
                                std::to_string(offset)));
    if (!bson_iter_init(&iter, &bson))
        throw CCommandError(CErrorCode::FailedToParse,
                            CErrorMessages::invalidBson("malformed document"));
    return readDocument(&iter);
}

CDocument
CBsonCodec::fromJson(const string& json)
{
    bson_error_t error;
    bson_iter_t iter;
    CBsonPtr bson(bson_new_from_json(
        reinterpret_cast<const uint8_t*>(json.data()),
        static_cast<ssize_t>(json.size()), &error));

    if (!bson)
        throw CCommandError(CErrorCode::FailedToParse,
                            CErrorMessages::invalidBson(error.message));
    if (!bson_iter_init(&iter, bson.get()))
        throw CCommandError(CErrorCode::FailedToParse,
                            CErrorMessages::invalidBson("malformed document"));
    return readDocument(&iter);
}

string
CBsonCodec::toJson(const CDocument& doc)
{
    CBsonPtr bson = build(doc, &CBsonCodec::appendDocument);
    size_t len = 0;
    char* json = bson_as_relaxed_extended_json(bson.get(), &len);

    if (!json)
        throw CCommandError(CErrorCode::InternalError,
                            CErrorMessages::invalidBson(
                                "cannot render extended JSON"));

    string result(json, len);

    bson_free(json);
    return result;
}

void
CBsonCodec::appendDocument(bson_t* out, const CDocument& doc)
{
    for (const auto& field : doc.fields())
        appendValue(out, field.key, field.value);
}

void
CBsonCodec::appendArray(bson_t* out, const CArray& arr)
{
    for (size_t i = 0; i < arr.size(); i++)
        appendValue(out, std::to_string(i), arr.at(i));
}

/*
 * appendValue
 *		Keys are passed with an explicit length so that libbson refuses
 *		keys with embedded NUL bytes instead of truncating them.
 */
void
CBsonCodec::appendValue(bson_t* out, const string& key, const CValue& value)
{
    const char* k = key.c_str();
    int klen = static_cast<int>(key.size());
    bool ok = false;

    switch (value.type())
    {
    case CValueType::Null:
        ok = bson_append_null(out, k, klen);
        break;
    case CValueType::Double:
        ok = bson_append_double(out, k, klen, value.as<double>());
        break;
    case CValueType::String:
    {
        const string& s = value.as<string>();

        ok = bson_append_utf8(out, k, klen, s.c_str(),
                              static_cast<int>(s.size()));
        break;
    }
    case CValueType::Document:
    {
        bson_t child;

        ok = bson_append_document_begin(out, k, klen, &child);
        if (ok)
        {
            appendDocument(&child, value.as<CDocument>());
            ok = bson_append_document_end(out, &child);
        }
        break;
    }
    case CValueType::Array:
    {
        bson_t child;

        ok = bson_append_array_begin(out, k, klen, &child);
        if (ok)
        {
            appendArray(&child, value.as<CArray>());
            ok = bson_append_array_end(out, &child);
        }
        break;
    }
    case CValueType::Binary:
    {
        const CBinary& bin = value.as<CBinary>();

        ok = bson_append_binary(out, k, klen,
                                static_cast<bson_subtype_t>(bin.subtype),
                                bin.data.data(),
                                static_cast<uint32_t>(bin.data.size()));
        break;
    }
    case CValueType::ObjectId:
    {
        bson_oid_t oid;

        std::memcpy(oid.bytes, value.as<CObjectId>().bytes.data(),
                    sizeof(oid.bytes));
        ok = bson_append_oid(out, k, klen, &oid);
        break;
    }
    case CValueType::Boolean:
        ok = bson_append_bool(out, k, klen, value.as<bool>());
        break;
    case CValueType::DateTime:
        ok = bson_append_date_time(out, k, klen,
                                   value.as<CDateTime>().millis);
        break;
    case CValueType::Regex:
    {
        const CRegex& re = value.as<CRegex>();

        ok = bson_append_regex(out, k, klen, re.pattern.c_str(),
                               re.options.c_str());
        break;
    }
    case CValueType::Int32:
        ok = bson_append_int32(out, k, klen, value.as<int32_t>());
        break;
    case CValueType::Timestamp:
    {
        const CTimestamp& ts = value.as<CTimestamp>();

        ok = bson_append_timestamp(out, k, klen, ts.seconds, ts.increment);
        break;
    }
    case CValueType::Int64:
        ok = bson_append_int64(out, k, klen, value.as<int64_t>());
        break;
    case CValueType::Decimal128:
    {
        bson_decimal128_t dec;

        dec.high = value.as<CDecimal128>().high;
        dec.low = value.as<CDecimal128>().low;
        ok = bson_append_decimal128(out, k, klen, &dec);
        break;
    }
    }

    if (!ok)
        appendFailed(key);
}

CDocument
CBsonCodec::readDocument(bson_iter_t* iter)
{
    CDocument doc;

    while (bson_iter_next(iter))
        doc.append(string(bson_iter_key(iter)), readValue(iter));
    return doc;
}

CArray
CBsonCodec::readArray(bson_iter_t* iter)
{
    CArray arr;

    while (bson_iter_next(iter))
        arr.push_back(readValue(iter));
    return arr;
}

CValue
CBsonCodec::readValue(const bson_iter_t* iter)
{
    switch (bson_iter_type(iter))
    {
    case BSON_TYPE_DOUBLE:
        return CValue(bson_iter_double(iter));
    case BSON_TYPE_UTF8:
    {
        uint32_t len = 0;
        const char* s = bson_iter_utf8(iter, &len);

        return CValue(string(s, len));
    }
    case BSON_TYPE_SYMBOL:
    {
        uint32_t len = 0;
        const char* s = bson_iter_symbol(iter, &len);

        return CValue(string(s, len));
    }
    case BSON_TYPE_DOCUMENT:
    {
        bson_iter_t child;

        if (!bson_iter_recurse(iter, &child))
            throw CCommandError(CErrorCode::FailedToParse,
                                CErrorMessages::invalidBson(
                                    "malformed embedded document"));
        return CValue(readDocument(&child));
    }
    case BSON_TYPE_ARRAY:
    {
        bson_iter_t child;

        if (!bson_iter_recurse(iter, &child))
            throw CCommandError(CErrorCode::FailedToParse,
                                CErrorMessages::invalidBson(
                                    "malformed embedded array"));
        return CValue(readArray(&child));
    }
    case BSON_TYPE_BINARY:
    {
        bson_subtype_t subtype;
        uint32_t len = 0;
        const uint8_t* data = nullptr;
        CBinary bin;

        bson_iter_binary(iter, &subtype, &len, &data);
        bin.subtype = static_cast<uint8_t>(subtype);
        if (data)
            bin.data.assign(data, data + len);
        return CValue(std::move(bin));
    }
    case BSON_TYPE_OID:
    {
        CObjectId oid;

        std::memcpy(oid.bytes.data(), bson_iter_oid(iter)->bytes,
                    oid.bytes.size());
        return CValue(oid);
    }
    case BSON_TYPE_BOOL:
        return CValue(bson_iter_bool(iter));
    case BSON_TYPE_DATE_TIME:
        return CValue(CDateTime{bson_iter_date_time(iter)});
    case BSON_TYPE_NULL:
    case BSON_TYPE_UNDEFINED:
        return CValue();
    case BSON_TYPE_REGEX:
    {
        const char* options = nullptr;
        const char* pattern = bson_iter_regex(iter, &options);

        return CValue(CRegex{pattern, options ? options : ""});
    }
    case BSON_TYPE_INT32:
        return CValue(bson_iter_int32(iter));
    case BSON_TYPE_TIMESTAMP:
    {
        uint32_t seconds = 0;
        uint32_t increment = 0;

        bson_iter_timestamp(iter, &seconds, &increment);
        return CValue(CTimestamp{seconds, increment});
    }
    case BSON_TYPE_INT64:
        return CValue(int64_t{bson_iter_int64(iter)});
    case BSON_TYPE_DECIMAL128:
    {
        bson_decimal128_t dec;

        bson_iter_decimal128(iter, &dec);
        return CValue(CDecimal128{dec.high, dec.low});
    }
    default:
        throw CCommandError(CErrorCode::FailedToParse,
                            CErrorMessages::unsupportedBsonType(
                                static_cast<int>(bson_iter_type(iter))));
    }
}

} // namespace StrataDB
