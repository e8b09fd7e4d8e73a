/*-------------------------------------------------------------------------
 *
 * CQueryMatcher.hpp
 *      Query filter compilation and evaluation.
 *
 *      A filter document is compiled once into a tree of match
 *      expressions; every syntax error is raised at compile time so that
 *      an invalid filter fails even against an empty collection.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CValue.hpp"

#include <memory>
#include <vector>

namespace StrataDB
{

class IMatchExpression
{
  public:
    virtual ~IMatchExpression() = default;
    virtual bool matches(const CDocument& doc) const = 0;
};

class CQueryMatcher
{
  public:
    CQueryMatcher();
    explicit CQueryMatcher(const CDocument& filter);

    bool matches(const CDocument& doc) const;

    const CDocument& filter() const noexcept
    {
        return filter_;
    }

    /* One-shot helper; compiles the filter on every call */
    static bool match(const CDocument& doc, const CDocument& filter);

    /*
     * All values reachable through a dotted path. Array elements are
     * reached by numeric segment and documents inside arrays are searched
     * for the remaining path.
     */
    static vector<const CValue*> collect(const CDocument& doc,
                                         const string& path);

  private:
    CDocument filter_;
    std::shared_ptr<const IMatchExpression> root_;
};

} // namespace StrataDB
