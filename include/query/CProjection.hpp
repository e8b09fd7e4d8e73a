/*-------------------------------------------------------------------------
 *
 * CProjection.hpp
 *      Field projection with inclusion, exclusion and $slice.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CValue.hpp"

#include <map>
#include <memory>
#include <optional>

namespace StrataDB
{

/*
 * CSlice
 *		A negative skip counts from the end of the array. No limit means
 *		"up to the end".
 */
struct CSlice
{
    int64_t skip = 0;
    std::optional<int64_t> limit;

    CArray apply(const CArray& arr) const;
};

class CProjection
{
  public:
    CProjection();
    explicit CProjection(const CDocument& spec);

    bool isInclusion() const noexcept
    {
        return inclusion_;
    }

    CDocument apply(const CDocument& doc) const;

    static CDocument project(const CDocument& doc, const CDocument& spec);

    /* Parses a $slice argument, throwing on malformed syntax */
    static CSlice parseSlice(const CValue& arg);

  private:
    struct CNode
    {
        enum class Kind
        {
            Branch,
            Include,
            Exclude,
            Slice,
            Literal
        };

        Kind kind = Kind::Branch;
        CSlice slice;
        CValue literal;
        std::map<string, std::shared_ptr<CNode>> children;
    };

    void addPath(const string& path, const CNode& leaf);

    CDocument include(const CDocument& doc, const CNode& node,
                      bool topLevel) const;
    CDocument exclude(const CDocument& doc, const CNode& node) const;
    std::optional<CValue> includeValue(const CValue& value,
                                       const CNode& node) const;
    CValue excludeValue(const CValue& value, const CNode& node) const;

    bool inclusion_ = false;
    bool excludeId_ = false;
    CNode root_;
};

} // namespace StrataDB
