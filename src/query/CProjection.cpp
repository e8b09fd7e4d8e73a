/*-------------------------------------------------------------------------
 *
 * CProjection.cpp
 *      Field projection with inclusion, exclusion and $slice.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "query/CProjection.hpp"

#include "document/CPath.hpp"
#include "errors/CCommandError.hpp"
#include "errors/CErrorMessages.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace StrataDB
{

namespace
{

constexpr int64_t kMaxCount = std::numeric_limits<int64_t>::max();

/* Truncate toward zero, saturating at +/- kMaxCount; NaN becomes 0 */
int64_t
truncateCount(const CValue& value)
{
    if (value.is<int32_t>())
        return value.as<int32_t>();
    if (value.is<int64_t>())
        return std::max(value.as<int64_t>(), -kMaxCount);

    double d = value.toDouble();

    if (std::isnan(d))
        return 0;
    if (d >= 9.2233720368547758e18)
        return kMaxCount;
    if (d <= -9.2233720368547758e18)
        return -kMaxCount;
    return static_cast<int64_t>(std::trunc(d));
}

void
validatePath(const string& path)
{
    if (path.empty())
        throw CCommandError(CErrorCode::Location40352,
                            CErrorMessages::emptyFieldPath());
    if (CPath::hasEmptySegment(path))
        throw CCommandError(CErrorCode::Location15998,
                            CErrorMessages::fieldPathEmptySegment());
    for (const auto& segment : CPath::split(path))
    {
        if (segment.front() == '$')
            throw CCommandError(CErrorCode::Location16410,
                                CErrorMessages::fieldPathStartsWithDollar());
    }
}

} // namespace

CArray
CSlice::apply(const CArray& arr) const
{
    auto len = static_cast<int64_t>(arr.size());
    int64_t start = 0;
    int64_t end = len;
    CArray result;

    if (skip >= 0)
        start = std::min(skip, len);
    else
        start = -skip >= len ? 0 : len + skip;
    if (limit && *limit < len - start)
        end = start + *limit;

    for (int64_t i = start; i < end; i++)
        result.push_back(arr.at(static_cast<size_t>(i)));
    return result;
}

/*
 * parseSlice
 *		Accepts a single number or a [skip, limit] pair. A null limit
 *		means no limit.
 */
CSlice
CProjection::parseSlice(const CValue& arg)
{
    CSlice slice;

    if (arg.isArray())
    {
        const auto& arr = arg.as<CArray>();

        if (arr.size() != 2 && arr.size() != 3)
            throw CCommandError(CErrorCode::Location28667,
                                CErrorMessages::sliceArrayArity(arg,
                                                                arr.size()));

        const CValue& skip = arr.at(0);
        const CValue& limit = arr.at(1);

        if (arr.size() == 3 || !skip.isNumber() ||
            !(limit.isNumber() || limit.isNull()))
            throw CCommandError(CErrorCode::Location28724,
                                CErrorMessages::sliceFirstArgument(skip));

        slice.skip = truncateCount(skip);
        if (limit.isNumber())
        {
            int64_t count = truncateCount(limit);

            if (count < 0)
                throw CCommandError(CErrorCode::Location28724,
                                    CErrorMessages::sliceFirstArgument(skip));
            slice.limit = count;
        }
        return slice;
    }

    if (!arg.isNumber())
        throw CCommandError(CErrorCode::Location28667,
                            CErrorMessages::sliceSingleArgument(arg));

    int64_t count = truncateCount(arg);

    if (count >= 0)
        slice.limit = count;
    else
        slice.skip = count;
    return slice;
}

CProjection::CProjection()
{
}

CProjection::CProjection(const CDocument& spec)
{
    std::optional<bool> mode;
    bool idIncluded = false;

    for (const auto& field : spec.fields())
    {
        const string& key = field.key;
        const CValue& value = field.value;
        CNode leaf;
        bool included = true;

        validatePath(key);

        if (value.isDocument())
        {
            const auto& doc = value.as<CDocument>();

            if (doc.size() != 1 || doc.firstKey() != "$slice")
                throw CCommandError(
                    CErrorCode::NotImplemented,
                    CErrorMessages::projectionOperatorNotSupported(value));
            leaf.kind = CNode::Kind::Slice;
            leaf.slice = parseSlice(*doc.get("$slice"));
            addPath(key, leaf);
            continue;
        }

        if (value.is<bool>())
            included = value.as<bool>();
        else if (value.isNumber())
            included = value.toDouble() != 0.0;
        else
        {
            leaf.kind = CNode::Kind::Literal;
            leaf.literal = value;
        }
        if (leaf.kind != CNode::Kind::Literal)
            leaf.kind = included ? CNode::Kind::Include : CNode::Kind::Exclude;

        if (key == "_id")
        {
            if (!included)
                excludeId_ = true;
            else
            {
                idIncluded = leaf.kind == CNode::Kind::Include;
                addPath(key, leaf);
            }
            continue;
        }

        if (!mode)
            mode = included;
        else if (*mode != included)
            throw included ? CCommandError(
                                 CErrorCode::Location31254,
                                 CErrorMessages::inclusionInExclusion(key))
                           : CCommandError(
                                 CErrorCode::Location31253,
                                 CErrorMessages::exclusionInInclusion(key));
        addPath(key, leaf);
    }

    inclusion_ = mode.value_or(idIncluded && spec.size() == 1);
}

void
CProjection::addPath(const string& path, const CNode& leaf)
{
    vector<string> segments = CPath::split(path);
    CNode* node = &root_;

    for (size_t i = 0; i + 1 < segments.size(); i++)
    {
        auto& child = node->children[segments[i]];

        if (!child)
            child = std::make_shared<CNode>();
        else if (child->kind != CNode::Kind::Branch)
            return;
        node = child.get();
    }
    node->children[segments.back()] = std::make_shared<CNode>(leaf);
}

CDocument
CProjection::apply(const CDocument& doc) const
{
    CDocument out = inclusion_ ? include(doc, root_, true)
                               : exclude(doc, root_);

    if (excludeId_)
        out.remove("_id");
    return out;
}

CDocument
CProjection::project(const CDocument& doc, const CDocument& spec)
{
    return CProjection(spec).apply(doc);
}

CDocument
CProjection::include(const CDocument& doc, const CNode& node,
                     bool topLevel) const
{
    CDocument out;

    for (const auto& field : doc.fields())
    {
        auto it = node.children.find(field.key);

        if (it == node.children.end())
        {
            if (topLevel && field.key == "_id")
                out.append(field.key, field.value);
            continue;
        }

        const CNode& child = *it->second;

        switch (child.kind)
        {
        case CNode::Kind::Include:
            out.append(field.key, field.value);
            break;
        case CNode::Kind::Slice:
            out.append(field.key,
                       field.value.isArray()
                           ? CValue(child.slice.apply(field.value.as<CArray>()))
                           : field.value);
            break;
        case CNode::Kind::Branch:
            if (auto value = includeValue(field.value, child))
                out.append(field.key, std::move(*value));
            break;
        case CNode::Kind::Exclude:
        case CNode::Kind::Literal:
            break;
        }
    }

    for (const auto& [key, child] : node.children)
    {
        if (child->kind != CNode::Kind::Literal)
            continue;
        if (key == "_id")
        {
            out.remove(key);
            out.prepend(key, child->literal);
        }
        else
            out.set(key, child->literal);
    }
    return out;
}

/* Arrays keep only their documents, projected element by element */
std::optional<CValue>
CProjection::includeValue(const CValue& value, const CNode& node) const
{
    if (value.isDocument())
        return CValue(include(value.as<CDocument>(), node, false));
    if (value.isArray())
    {
        CArray projected;

        for (const auto& element : value.as<CArray>().values())
        {
            if (element.isDocument())
                projected.push_back(include(element.as<CDocument>(), node,
                                            false));
        }
        return CValue(std::move(projected));
    }
    return std::nullopt;
}

CDocument
CProjection::exclude(const CDocument& doc, const CNode& node) const
{
    CDocument out;

    for (const auto& field : doc.fields())
    {
        auto it = node.children.find(field.key);

        if (it == node.children.end())
        {
            out.append(field.key, field.value);
            continue;
        }

        const CNode& child = *it->second;

        switch (child.kind)
        {
        case CNode::Kind::Exclude:
            break;
        case CNode::Kind::Include:
            out.append(field.key, field.value);
            break;
        case CNode::Kind::Slice:
            out.append(field.key,
                       field.value.isArray()
                           ? CValue(child.slice.apply(field.value.as<CArray>()))
                           : field.value);
            break;
        case CNode::Kind::Literal:
            out.append(field.key, child.literal);
            break;
        case CNode::Kind::Branch:
            out.append(field.key, excludeValue(field.value, child));
            break;
        }
    }
    return out;
}

CValue
CProjection::excludeValue(const CValue& value, const CNode& node) const
{
    if (value.isDocument())
        return CValue(exclude(value.as<CDocument>(), node));
    if (value.isArray())
    {
        CArray projected;

        for (const auto& element : value.as<CArray>().values())
        {
            if (element.isDocument())
                projected.push_back(exclude(element.as<CDocument>(), node));
            else
                projected.push_back(element);
        }
        return CValue(std::move(projected));
    }
    return value;
}

} // namespace StrataDB
