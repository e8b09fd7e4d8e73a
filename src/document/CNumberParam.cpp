/*-------------------------------------------------------------------------
 *
 * CNumberParam.cpp
 *      Whole-number conversion of numeric command arguments.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CNumberParam.hpp"

#include "errors/CCommandError.hpp"
#include "errors/CErrorMessages.hpp"

#include <cmath>
#include <format>
#include <limits>

namespace StrataDB
{

CWholeNumberStatus
wholeNumber(const CValue& value, int64_t& out)
{
    if (value.is<int32_t>())
    {
        out = value.as<int32_t>();
        return CWholeNumberStatus::Ok;
    }
    if (value.is<int64_t>())
    {
        out = value.as<int64_t>();
        return CWholeNumberStatus::Ok;
    }
    if (!value.is<double>())
        return CWholeNumberStatus::UnexpectedType;

    double d = value.as<double>();

    if (std::isinf(d) && d > 0)
        return CWholeNumberStatus::Infinity;
    if (d >= 9223372036854775808.0)
        return CWholeNumberStatus::ExceedsPositive;
    if (d < -9223372036854775808.0)
        return CWholeNumberStatus::ExceedsNegative;
    if (std::isnan(d) || d != std::trunc(d))
        return CWholeNumberStatus::NotWholeNumber;

    out = static_cast<int64_t>(d);
    return CWholeNumberStatus::Ok;
}

int64_t
validatedNumberParam(const string& command, const string& param,
                     const CValue& value, int32_t minValue)
{
    constexpr int64_t int32Max = std::numeric_limits<int32_t>::max();
    int64_t whole = 0;

    switch (wholeNumber(value, whole))
    {
    case CWholeNumberStatus::Ok:
        break;

    case CWholeNumberStatus::UnexpectedType:
        if (value.isNull())
            return minValue;
        throw CCommandError(
            CErrorCode::TypeMismatch,
            CErrorMessages::wrongTypeNumeric(command + "." + param, value));

    case CWholeNumberStatus::NotWholeNumber:
    {
        double d = value.as<double>();

        if (std::isnan(d))
            return minValue;
        if (std::signbit(d))
            throw CCommandError(
                CErrorCode::Location51024,
                CErrorMessages::valueBelowMinimum(
                    param, std::to_string(static_cast<int64_t>(std::ceil(d))),
                    minValue));
        whole = static_cast<int64_t>(std::floor(d));
        break;
    }

    case CWholeNumberStatus::Infinity:
    case CWholeNumberStatus::ExceedsPositive:
        return int32Max;

    case CWholeNumberStatus::ExceedsNegative:
        throw CCommandError(
            CErrorCode::Location51024,
            CErrorMessages::valueBelowMinimum(
                param, std::format("{:.0f}", std::ceil(value.as<double>())),
                minValue));
    }

    if (whole < minValue)
        throw CCommandError(CErrorCode::Location51024,
                            CErrorMessages::valueBelowMinimum(
                                param, std::to_string(whole), minValue));

    return whole > int32Max ? int32Max : whole;
}

} // namespace StrataDB
