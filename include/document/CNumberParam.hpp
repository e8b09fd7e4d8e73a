/*-------------------------------------------------------------------------
 *
 * CNumberParam.hpp
 *      Whole-number conversion of numeric command arguments.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CValue.hpp"

#include <cstdint>
#include <string>

namespace StrataDB
{

enum class CWholeNumberStatus
{
    Ok,
    UnexpectedType,
    NotWholeNumber,
    Infinity,
    ExceedsPositive,
    ExceedsNegative
};

/*
 * wholeNumber
 *		Accepts int32, int64 and doubles without a fractional part.
 *		out is only written on Ok.
 */
CWholeNumberStatus wholeNumber(const CValue& value, int64_t& out);

/*
 * Numeric argument such as "scale": null yields minValue, fractions are
 * floored, values above INT32_MAX are capped. Raises TypeMismatch for
 * non-numbers and Location51024 for values below minValue.
 */
int64_t validatedNumberParam(const string& command, const string& param,
                             const CValue& value, int32_t minValue);

} // namespace StrataDB
