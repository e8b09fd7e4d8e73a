/*-------------------------------------------------------------------------
 *
 * CValueFormat.hpp
 *      Text renderings of values used inside error messages.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CValue.hpp"

#include <string>

namespace StrataDB
{

/* Type alias as spelled in protocol messages ("double", "objectId", ...) */
string typeAlias(CValueType type);
string typeAlias(const CValue& value);

/*
 * Shell-style rendering: { a: 1, b: "x" }, [ 1, 2 ], 42.0, nan.0, inf.0
 */
string formatValue(const CValue& value);
string formatDocument(const CDocument& doc);
string formatDouble(double value);

/*
 * Rendering used by document validation: { "foo": +Inf }, keys quoted
 */
string renderValue(const CValue& value);
string renderField(const string& key, const CValue& value);

} // namespace StrataDB
