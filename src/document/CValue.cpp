/*-------------------------------------------------------------------------
 *
 * CValue.cpp
 *      Typed document value model for StrataDB.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CValue.hpp"

#include <bson/bson.h>

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace StrataDB
{

/*
 * CObjectId::generate
 *		New ObjectId from the library's process-wide generator
 */
CObjectId
CObjectId::generate()
{
    bson_oid_t oid;
    CObjectId result;

    bson_oid_init(&oid, nullptr);
    std::memcpy(result.bytes.data(), oid.bytes, result.bytes.size());
    return result;
}

bool
CObjectId::fromHex(const string& hex, CObjectId& out)
{
    bson_oid_t oid;

    if (hex.size() != 24 || !bson_oid_is_valid(hex.c_str(), hex.size()))
        return false;

    bson_oid_init_from_string(&oid, hex.c_str());
    std::memcpy(out.bytes.data(), oid.bytes, out.bytes.size());
    return true;
}

string
CObjectId::toHex() const
{
    bson_oid_t oid;
    char buf[25];

    std::memcpy(oid.bytes, bytes.data(), bytes.size());
    bson_oid_to_string(&oid, buf);
    return string(buf);
}

bool
CDecimal128::fromString(const string& text, CDecimal128& out)
{
    bson_decimal128_t dec;

    if (!bson_decimal128_from_string(text.c_str(), &dec))
        return false;
    out.high = dec.high;
    out.low = dec.low;
    return true;
}

string
CDecimal128::toString() const
{
    bson_decimal128_t dec;
    char buf[BSON_DECIMAL128_STRING];

    dec.high = high;
    dec.low = low;
    bson_decimal128_to_string(&dec, buf);
    return string(buf);
}

/*
 * CDecimal128::toDouble
 *		Nearest double; used only for cross-kind numeric ordering
 */
double
CDecimal128::toDouble() const
{
    string text = toString();

    if (text == "NaN" || text == "-NaN")
        return std::numeric_limits<double>::quiet_NaN();
    if (text == "Infinity")
        return std::numeric_limits<double>::infinity();
    if (text == "-Infinity")
        return -std::numeric_limits<double>::infinity();
    return std::strtod(text.c_str(), nullptr);
}

CArray::CArray(std::initializer_list<CValue> values) : values_(values)
{
}

size_t
CArray::size() const noexcept
{
    return values_.size();
}

bool
CArray::empty() const noexcept
{
    return values_.empty();
}

const CValue&
CArray::at(size_t index) const
{
    return values_.at(index);
}

CValue&
CArray::at(size_t index)
{
    return values_.at(index);
}

void
CArray::push_back(CValue value)
{
    values_.push_back(std::move(value));
}

void
CArray::resize(size_t count)
{
    values_.resize(count);
}

void
CArray::erase(size_t index)
{
    if (index < values_.size())
        values_.erase(values_.begin() + static_cast<std::ptrdiff_t>(index));
}

CDocument::CDocument(std::initializer_list<CField> fields) : fields_(fields)
{
}

size_t
CDocument::size() const noexcept
{
    return fields_.size();
}

bool
CDocument::empty() const noexcept
{
    return fields_.empty();
}

bool
CDocument::has(const string& key) const
{
    return get(key) != nullptr;
}

const CValue*
CDocument::get(const string& key) const
{
    for (const auto& field : fields_)
    {
        if (field.key == key)
            return &field.value;
    }
    return nullptr;
}

CValue*
CDocument::get(const string& key)
{
    for (auto& field : fields_)
    {
        if (field.key == key)
            return &field.value;
    }
    return nullptr;
}

/*
 * set
 *		Replace the value of an existing key in place, or append it
 */
void
CDocument::set(const string& key, CValue value)
{
    CValue* existing = get(key);

    if (existing)
    {
        *existing = std::move(value);
        return;
    }
    fields_.push_back(CField{key, std::move(value)});
}

void
CDocument::append(const string& key, CValue value)
{
    fields_.push_back(CField{key, std::move(value)});
}

void
CDocument::prepend(const string& key, CValue value)
{
    fields_.insert(fields_.begin(), CField{key, std::move(value)});
}

bool
CDocument::remove(const string& key)
{
    bool removed = false;

    for (auto it = fields_.begin(); it != fields_.end();)
    {
        if (it->key == key)
        {
            it = fields_.erase(it);
            removed = true;
        }
        else
            ++it;
    }
    return removed;
}

vector<string>
CDocument::keys() const
{
    vector<string> result;

    result.reserve(fields_.size());
    for (const auto& field : fields_)
        result.push_back(field.key);
    return result;
}

const string&
CDocument::firstKey() const
{
    static const string empty;

    return fields_.empty() ? empty : fields_.front().key;
}

CValueType
CValue::type() const noexcept
{
    switch (data_.index())
    {
    case 0:
        return CValueType::Null;
    case 1:
        return CValueType::Double;
    case 2:
        return CValueType::String;
    case 3:
        return CValueType::Document;
    case 4:
        return CValueType::Array;
    case 5:
        return CValueType::Binary;
    case 6:
        return CValueType::ObjectId;
    case 7:
        return CValueType::Boolean;
    case 8:
        return CValueType::DateTime;
    case 9:
        return CValueType::Regex;
    case 10:
        return CValueType::Int32;
    case 11:
        return CValueType::Timestamp;
    case 12:
        return CValueType::Int64;
    default:
        return CValueType::Decimal128;
    }
}

bool
CValue::isNumber() const noexcept
{
    return is<double>() || is<int32_t>() || is<int64_t>() ||
           is<CDecimal128>();
}

double
CValue::toDouble() const
{
    if (is<double>())
        return as<double>();
    if (is<int32_t>())
        return static_cast<double>(as<int32_t>());
    if (is<int64_t>())
        return static_cast<double>(as<int64_t>());
    if (is<CDecimal128>())
        return as<CDecimal128>().toDouble();
    return 0.0;
}

bool
CValue::isNaN() const
{
    if (is<double>())
        return std::isnan(as<double>());
    if (is<CDecimal128>())
        return std::isnan(as<CDecimal128>().toDouble());
    return false;
}

} // namespace StrataDB
