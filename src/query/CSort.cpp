/*-------------------------------------------------------------------------
 *
 * CSort.cpp
 *      Multi-key document ordering for find.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "query/CSort.hpp"

#include "document/CNumberParam.hpp"
#include "document/CValueCompare.hpp"
#include "errors/CCommandError.hpp"
#include "errors/CErrorMessages.hpp"
#include "query/CQueryMatcher.hpp"

#include <algorithm>

namespace StrataDB
{

CSort::CSort(const CDocument& spec)
{
    for (const auto& field : spec.fields())
    {
        if (field.key.find('$') != string::npos)
            throw CCommandError(CErrorCode::Location16410,
                                CErrorMessages::fieldPathStartsWithDollar());

        if (!field.value.isNumber())
            throw CCommandError(
                CErrorCode::Location15974,
                CErrorMessages::sortIllegalKey(field.key, field.value));

        int64_t order = 0;

        if (wholeNumber(field.value, order) != CWholeNumberStatus::Ok)
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::sortNotWholeNumber());
        if (order != 1 && order != -1)
            throw CCommandError(CErrorCode::Location15975,
                                CErrorMessages::sortBadOrder());

        keys_.emplace_back(field.key, order == -1);
    }
}

CValue
CSort::sortKey(const CDocument& doc, const string& path, bool descending)
{
    vector<const CValue*> found = CQueryMatcher::collect(doc, path);
    const CValue* best = nullptr;

    for (const CValue* value : found)
    {
        vector<const CValue*> candidates;

        if (value->isArray())
        {
            for (const auto& element : value->as<CArray>().values())
                candidates.push_back(&element);
        }
        else
            candidates.push_back(value);

        for (const CValue* candidate : candidates)
        {
            if (!best)
            {
                best = candidate;
                continue;
            }

            int cmp = compareValues(*candidate, *best);

            if (descending ? cmp > 0 : cmp < 0)
                best = candidate;
        }
    }

    return best ? *best : CValue();
}

int
CSort::compare(const CDocument& a, const CDocument& b) const
{
    for (const auto& [path, descending] : keys_)
    {
        int cmp = compareValues(sortKey(a, path, descending),
                                sortKey(b, path, descending));

        if (cmp != 0)
            return descending ? -cmp : cmp;
    }
    return 0;
}

void
CSort::apply(vector<CDocument>& docs) const
{
    if (keys_.empty())
        return;

    std::stable_sort(docs.begin(), docs.end(),
                     [this](const CDocument& a, const CDocument& b) {
                         return compare(a, b) < 0;
                     });
}

} // namespace StrataDB
