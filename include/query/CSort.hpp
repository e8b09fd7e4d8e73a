/*-------------------------------------------------------------------------
 *
 * CSort.hpp
 *      Multi-key document ordering for find.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CValue.hpp"

#include <utility>
#include <vector>

namespace StrataDB
{

class CSort
{
  public:
    CSort() = default;

    /* { field: 1 | -1, ... }; raises on an invalid specification */
    explicit CSort(const CDocument& spec);

    bool empty() const noexcept
    {
        return keys_.empty();
    }

    /* Stable; documents comparing equal keep their scan order */
    void apply(vector<CDocument>& docs) const;

    /* Negative, zero or positive like compareValues */
    int compare(const CDocument& a, const CDocument& b) const;

  private:
    /* Missing fields sort as null, arrays by their min (asc) or max (desc) */
    static CValue sortKey(const CDocument& doc, const string& path,
                          bool descending);

    vector<std::pair<string, bool>> keys_;
};

} // namespace StrataDB
