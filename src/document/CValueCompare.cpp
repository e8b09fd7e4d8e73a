/*-------------------------------------------------------------------------
 *
 * CValueCompare.cpp
 *      Total order and equality over document values.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CValueCompare.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace StrataDB
{

namespace
{

template <typename T>
int
threeWay(const T& a, const T& b)
{
    if (a < b)
        return -1;
    if (b < a)
        return 1;
    return 0;
}

bool
isIntegral(const CValue& v)
{
    return v.is<int32_t>() || v.is<int64_t>();
}

int64_t
integralValue(const CValue& v)
{
    return v.is<int32_t>() ? v.as<int32_t>() : v.as<int64_t>();
}

/*
 * compareIntegralToDouble
 *		Exact comparison: the double is split into its integral part,
 *		compared as int64, and its fraction. d must not be NaN.
 */
int
compareIntegralToDouble(int64_t i, double d)
{
    constexpr double twoTo63 = 9223372036854775808.0;

    if (d >= twoTo63)
        return -1;
    if (d < -twoTo63)
        return 1;

    double whole = std::trunc(d);
    int result = threeWay(i, static_cast<int64_t>(whole));

    if (result != 0)
        return result;
    return threeWay(0.0, d - whole);
}

int
compareNumbers(const CValue& a, const CValue& b)
{
    bool aNaN = a.isNaN();
    bool bNaN = b.isNaN();

    if (aNaN || bNaN)
    {
        if (aNaN && bNaN)
            return 0;
        return aNaN ? -1 : 1;
    }

    if (isIntegral(a) && isIntegral(b))
        return threeWay(integralValue(a), integralValue(b));

    if (isIntegral(a))
        return compareIntegralToDouble(integralValue(a), b.toDouble());
    if (isIntegral(b))
        return -compareIntegralToDouble(integralValue(b), a.toDouble());
    return threeWay(a.toDouble(), b.toDouble());
}

int
compareDocuments(const CDocument& a, const CDocument& b)
{
    size_t n = std::min(a.size(), b.size());

    for (size_t i = 0; i < n; ++i)
    {
        const CField& fa = a.fields()[i];
        const CField& fb = b.fields()[i];
        int result;

        result = threeWay(typeOrder(fa.value), typeOrder(fb.value));
        if (result != 0)
            return result;

        result = threeWay(fa.key.compare(fb.key), 0);
        if (result != 0)
            return result;

        result = compareValues(fa.value, fb.value);
        if (result != 0)
            return result;
    }
    return threeWay(a.size(), b.size());
}

int
compareArrays(const CArray& a, const CArray& b)
{
    size_t n = std::min(a.size(), b.size());

    for (size_t i = 0; i < n; ++i)
    {
        int result = compareValues(a.at(i), b.at(i));

        if (result != 0)
            return result;
    }
    return threeWay(a.size(), b.size());
}

int
compareBinary(const CBinary& a, const CBinary& b)
{
    int result = threeWay(a.data.size(), b.data.size());

    if (result != 0)
        return result;
    result = threeWay(a.subtype, b.subtype);
    if (result != 0)
        return result;
    if (a.data.empty())
        return 0;
    return threeWay(std::memcmp(a.data.data(), b.data.data(), a.data.size()),
                    0);
}

} // namespace

int
typeOrder(const CValue& value) noexcept
{
    switch (value.type())
    {
    case CValueType::Null:
        return 1;
    case CValueType::Double:
    case CValueType::Int32:
    case CValueType::Int64:
    case CValueType::Decimal128:
        return 2;
    case CValueType::String:
        return 3;
    case CValueType::Document:
        return 4;
    case CValueType::Array:
        return 5;
    case CValueType::Binary:
        return 6;
    case CValueType::ObjectId:
        return 7;
    case CValueType::Boolean:
        return 8;
    case CValueType::DateTime:
        return 9;
    case CValueType::Timestamp:
        return 10;
    case CValueType::Regex:
        return 11;
    }
    return 0;
}

int
compareValues(const CValue& a, const CValue& b)
{
    int order = threeWay(typeOrder(a), typeOrder(b));

    if (order != 0)
        return order;

    switch (a.type())
    {
    case CValueType::Null:
        return 0;
    case CValueType::Double:
    case CValueType::Int32:
    case CValueType::Int64:
    case CValueType::Decimal128:
        return compareNumbers(a, b);
    case CValueType::String:
        return threeWay(a.as<string>().compare(b.as<string>()), 0);
    case CValueType::Document:
        return compareDocuments(a.as<CDocument>(), b.as<CDocument>());
    case CValueType::Array:
        return compareArrays(a.as<CArray>(), b.as<CArray>());
    case CValueType::Binary:
        return compareBinary(a.as<CBinary>(), b.as<CBinary>());
    case CValueType::ObjectId:
        return threeWay(a.as<CObjectId>().bytes, b.as<CObjectId>().bytes);
    case CValueType::Boolean:
        return threeWay(a.as<bool>(), b.as<bool>());
    case CValueType::DateTime:
        return threeWay(a.as<CDateTime>().millis, b.as<CDateTime>().millis);
    case CValueType::Timestamp:
        return threeWay(a.as<CTimestamp>().value(),
                        b.as<CTimestamp>().value());
    case CValueType::Regex:
    {
        const CRegex& ra = a.as<CRegex>();
        const CRegex& rb = b.as<CRegex>();
        int result = threeWay(ra.pattern.compare(rb.pattern), 0);

        return result != 0 ? result
                           : threeWay(ra.options.compare(rb.options), 0);
    }
    }
    return 0;
}

bool
valuesEqual(const CValue& a, const CValue& b)
{
    return compareValues(a, b) == 0;
}

bool
identical(const CDocument& a, const CDocument& b)
{
    if (a.size() != b.size())
        return false;

    for (size_t i = 0; i < a.size(); ++i)
    {
        if (a.fields()[i].key != b.fields()[i].key)
            return false;
        if (!identical(a.fields()[i].value, b.fields()[i].value))
            return false;
    }
    return true;
}

bool
identical(const CValue& a, const CValue& b)
{
    if (a.type() != b.type())
        return false;

    switch (a.type())
    {
    case CValueType::Double:
    {
        double x = a.as<double>();
        double y = b.as<double>();

        if (std::isnan(x) || std::isnan(y))
            return std::isnan(x) && std::isnan(y);
        return x == y && std::signbit(x) == std::signbit(y);
    }
    case CValueType::Document:
        return identical(a.as<CDocument>(), b.as<CDocument>());
    case CValueType::Array:
    {
        const CArray& x = a.as<CArray>();
        const CArray& y = b.as<CArray>();

        if (x.size() != y.size())
            return false;
        for (size_t i = 0; i < x.size(); ++i)
        {
            if (!identical(x.at(i), y.at(i)))
                return false;
        }
        return true;
    }
    case CValueType::Decimal128:
        return a.as<CDecimal128>() == b.as<CDecimal128>();
    default:
        return compareValues(a, b) == 0;
    }
}

} // namespace StrataDB
