/*-------------------------------------------------------------------------
 *
 * CPath.hpp
 *      Dotted field paths over documents and arrays.
 *
 *      "a.b.2.c" addresses key c of the third element of array b inside
 *      document a. Numeric segments index arrays, all other segments
 *      address document keys.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CValue.hpp"

#include <optional>
#include <string>
#include <vector>

namespace StrataDB
{

class CPath
{
  public:
    /* Most nulls a single set may pad an array with */
    static constexpr size_t kMaxBackfill = 1500000;

    static vector<string> split(const string& path);
    static bool hasEmptySegment(const string& path);

    /* Non-negative decimal array index, or nullopt */
    static std::optional<size_t> arrayIndex(const string& segment);

    /* Exact lookup, no fan-out over array elements */
    static const CValue* get(const CDocument& doc, const string& path);
    static bool has(const CDocument& doc, const string& path);

    /*
     * Store value at path, creating intermediate documents and padding
     * arrays with nulls. Throws UnsuitableValueType when a segment would
     * have to descend into a scalar, BadValue when the padding would
     * exceed kMaxBackfill.
     */
    static void set(CDocument& doc, const string& path, CValue value);

    /* Removes a key; an array element is replaced by null instead */
    static bool remove(CDocument& doc, const string& path);

    /* True when one path equals the other or is a prefix of it */
    static bool overlaps(const string& a, const string& b);
};

} // namespace StrataDB
