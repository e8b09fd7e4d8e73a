/*-------------------------------------------------------------------------
 *
 * CValueFormat.cpp
 *      Text renderings of values used inside error messages.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CValueFormat.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <format>

namespace StrataDB
{

namespace
{

string
quote(const string& text)
{
    string out = "\"";

    for (char c : text)
    {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

string
shortestDouble(double value)
{
    char buf[64];
    auto result = std::to_chars(buf, buf + sizeof(buf), value);

    return string(buf, result.ptr);
}

string
hexBytes(const vector<uint8_t>& data)
{
    string out;

    for (uint8_t b : data)
        out += std::format("{:02X}", b);
    return out;
}

template <typename Render>
string
renderArray(const CArray& arr, Render render)
{
    string out;

    if (arr.empty())
        return "[]";

    out = "[ ";
    for (size_t i = 0; i < arr.size(); ++i)
    {
        if (i > 0)
            out += ", ";
        out += render(arr.at(i));
    }
    out += " ]";
    return out;
}

} // namespace

string
typeAlias(CValueType type)
{
    switch (type)
    {
    case CValueType::Double:
        return "double";
    case CValueType::String:
        return "string";
    case CValueType::Document:
        return "object";
    case CValueType::Array:
        return "array";
    case CValueType::Binary:
        return "binData";
    case CValueType::ObjectId:
        return "objectId";
    case CValueType::Boolean:
        return "bool";
    case CValueType::DateTime:
        return "date";
    case CValueType::Null:
        return "null";
    case CValueType::Regex:
        return "regex";
    case CValueType::Int32:
        return "int";
    case CValueType::Timestamp:
        return "timestamp";
    case CValueType::Int64:
        return "long";
    case CValueType::Decimal128:
        return "decimal";
    }
    return "unknown";
}

string
typeAlias(const CValue& value)
{
    return typeAlias(value.type());
}

/*
 * formatDouble
 *		Integral values keep a trailing ".0"; specials use nan.0 / inf.0
 */
string
formatDouble(double value)
{
    if (std::isnan(value))
        return "nan.0";
    if (std::isinf(value))
        return value > 0 ? "inf.0" : "-inf.0";
    if (value == std::trunc(value) && std::fabs(value) < 1e15)
        return std::format("{:.1f}", value);
    return shortestDouble(value);
}

string
formatDocument(const CDocument& doc)
{
    string out;

    if (doc.empty())
        return "{}";

    out = "{ ";
    for (size_t i = 0; i < doc.size(); ++i)
    {
        const CField& field = doc.fields()[i];

        if (i > 0)
            out += ", ";
        out += field.key + ": " + formatValue(field.value);
    }
    out += " }";
    return out;
}

string
formatValue(const CValue& value)
{
    switch (value.type())
    {
    case CValueType::Double:
        return formatDouble(value.as<double>());
    case CValueType::String:
        return quote(value.as<string>());
    case CValueType::Document:
        return formatDocument(value.as<CDocument>());
    case CValueType::Array:
        return renderArray(value.as<CArray>(),
                           [](const CValue& v) { return formatValue(v); });
    case CValueType::Binary:
        return std::format("BinData({}, {})",
                           static_cast<int>(value.as<CBinary>().subtype),
                           hexBytes(value.as<CBinary>().data));
    case CValueType::ObjectId:
        return "ObjectId('" + value.as<CObjectId>().toHex() + "')";
    case CValueType::Boolean:
        return value.as<bool>() ? "true" : "false";
    case CValueType::DateTime:
        return std::format("new Date({})", value.as<CDateTime>().millis);
    case CValueType::Null:
        return "null";
    case CValueType::Regex:
        return "/" + value.as<CRegex>().pattern + "/" +
               value.as<CRegex>().options;
    case CValueType::Int32:
        return std::to_string(value.as<int32_t>());
    case CValueType::Timestamp:
        return std::format("Timestamp({}, {})",
                           value.as<CTimestamp>().seconds,
                           value.as<CTimestamp>().increment);
    case CValueType::Int64:
        return std::to_string(value.as<int64_t>());
    case CValueType::Decimal128:
        return "Decimal128(\"" + value.as<CDecimal128>().toString() + "\")";
    }
    return "";
}

string
renderValue(const CValue& value)
{
    switch (value.type())
    {
    case CValueType::Double:
    {
        double d = value.as<double>();

        if (std::isnan(d))
            return "NaN";
        if (std::isinf(d))
            return d > 0 ? "+Inf" : "-Inf";
        return shortestDouble(d);
    }
    case CValueType::Document:
    {
        const CDocument& doc = value.as<CDocument>();
        string out;

        if (doc.empty())
            return "{}";
        out = "{ ";
        for (size_t i = 0; i < doc.size(); ++i)
        {
            if (i > 0)
                out += ", ";
            out += quote(doc.fields()[i].key) + ": " +
                   renderValue(doc.fields()[i].value);
        }
        out += " }";
        return out;
    }
    case CValueType::Array:
        return renderArray(value.as<CArray>(),
                           [](const CValue& v) { return renderValue(v); });
    default:
        return formatValue(value);
    }
}

string
renderField(const string& key, const CValue& value)
{
    return "{ " + quote(key) + ": " + renderValue(value) + " }";
}

} // namespace StrataDB
