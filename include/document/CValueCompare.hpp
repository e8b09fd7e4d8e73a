/*-------------------------------------------------------------------------
 *
 * CValueCompare.hpp
 *      Total order and equality over document values.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CValue.hpp"

namespace StrataDB
{

/*
 * Canonical type bracket. Values of different brackets order by bracket;
 * all numeric kinds share one bracket and compare by magnitude.
 */
int typeOrder(const CValue& value) noexcept;

/* -1, 0 or 1. NaN equals NaN and sorts below every other number. */
int compareValues(const CValue& a, const CValue& b);

/* Structural equality with numeric coercion, as used by query matching */
bool valuesEqual(const CValue& a, const CValue& b);

/* Same kind and same value, recursively; 1 and 1.0 are not identical */
bool identical(const CValue& a, const CValue& b);
bool identical(const CDocument& a, const CDocument& b);

} // namespace StrataDB
