/*-------------------------------------------------------------------------
 *
 * CPath.cpp
 *      Dotted field paths over documents and arrays.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CPath.hpp"

#include "errors/CCommandError.hpp"
#include "errors/CErrorMessages.hpp"

#include <charconv>

namespace StrataDB
{

vector<string>
CPath::split(const string& path)
{
    vector<string> segments;
    size_t start = 0;

    for (;;)
    {
        size_t dot = path.find('.', start);
        if (dot == string::npos)
        {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

bool
CPath::hasEmptySegment(const string& path)
{
    for (const auto& segment : split(path))
    {
        if (segment.empty())
            return true;
    }
    return false;
}

std::optional<size_t>
CPath::arrayIndex(const string& segment)
{
    size_t index = 0;

    if (segment.empty() || segment.size() > 18)
        return std::nullopt;
    for (char c : segment)
    {
        if (c < '0' || c > '9')
            return std::nullopt;
    }
    auto [ptr, ec] = std::from_chars(segment.data(),
                                     segment.data() + segment.size(), index);
    if (ec != std::errc() || ptr != segment.data() + segment.size())
        return std::nullopt;
    return index;
}

const CValue*
CPath::get(const CDocument& doc, const string& path)
{
    vector<string> segments = split(path);
    const CValue* current = doc.get(segments.front());

    for (size_t i = 1; i < segments.size() && current; i++)
    {
        if (current->isDocument())
        {
            current = current->as<CDocument>().get(segments[i]);
        }
        else if (current->isArray())
        {
            auto index = arrayIndex(segments[i]);
            const auto& arr = current->as<CArray>();

            if (!index || *index >= arr.size())
                return nullptr;
            current = &arr.at(*index);
        }
        else
            return nullptr;
    }
    return current;
}

bool
CPath::has(const CDocument& doc, const string& path)
{
    return get(doc, path) != nullptr;
}

/*
 * set
 *		Walk the path, materializing missing containers on the way down.
 *		The container kind created for a missing segment is always a
 *		document; arrays are only ever extended, never invented.
 */
void
CPath::set(CDocument& doc, const string& path, CValue value)
{
    vector<string> segments = split(path);
    CValue* current = nullptr;
    string currentKey = segments.front();

    if (segments.size() == 1)
    {
        doc.set(segments.front(), std::move(value));
        return;
    }

    current = doc.get(segments.front());
    if (!current)
    {
        doc.append(segments.front(), CDocument{});
        current = doc.get(segments.front());
    }

    for (size_t i = 1; i < segments.size(); i++)
    {
        const string& segment = segments[i];
        bool last = i + 1 == segments.size();
        CValue* next = nullptr;

        if (current->isDocument())
        {
            auto& child = current->as<CDocument>();

            if (last)
            {
                child.set(segment, std::move(value));
                return;
            }
            next = child.get(segment);
            if (!next)
            {
                child.append(segment, CDocument{});
                next = child.get(segment);
            }
        }
        else if (current->isArray())
        {
            auto& arr = current->as<CArray>();
            auto index = arrayIndex(segment);

            if (!index)
                throw CCommandError(CErrorCode::UnsuitableValueType,
                                    CErrorMessages::cannotCreateField(
                                        segment, currentKey, *current));
            if (*index > arr.size() && *index - arr.size() > kMaxBackfill)
                throw CCommandError(CErrorCode::BadValue,
                                    CErrorMessages::backfillTooLarge(
                                        kMaxBackfill));
            if (*index >= arr.size())
                arr.resize(*index + 1);
            if (last)
            {
                arr.at(*index) = std::move(value);
                return;
            }
            next = &arr.at(*index);
            if (next->isNull())
                *next = CDocument{};
        }
        else
        {
            throw CCommandError(
                CErrorCode::UnsuitableValueType,
                CErrorMessages::cannotCreateField(segment, currentKey,
                                                  *current));
        }
        current = next;
        currentKey = segment;
    }
}

bool
CPath::remove(CDocument& doc, const string& path)
{
    vector<string> segments = split(path);
    CValue* current = nullptr;

    if (segments.size() == 1)
        return doc.remove(path);

    current = doc.get(segments.front());
    for (size_t i = 1; i < segments.size() && current; i++)
    {
        const string& segment = segments[i];
        bool last = i + 1 == segments.size();

        if (current->isDocument())
        {
            auto& child = current->as<CDocument>();

            if (last)
                return child.remove(segment);
            current = child.get(segment);
        }
        else if (current->isArray())
        {
            auto& arr = current->as<CArray>();
            auto index = arrayIndex(segment);

            if (!index || *index >= arr.size())
                return false;
            if (last)
            {
                arr.at(*index) = CNull{};
                return true;
            }
            current = &arr.at(*index);
        }
        else
            return false;
    }
    return false;
}

bool
CPath::overlaps(const string& a, const string& b)
{
    const string& shorter = a.size() <= b.size() ? a : b;
    const string& longer = a.size() <= b.size() ? b : a;

    if (longer.compare(0, shorter.size(), shorter) != 0)
        return false;
    return longer.size() == shorter.size() || longer[shorter.size()] == '.';
}

} // namespace StrataDB
