/*-------------------------------------------------------------------------
 *
 * CDocumentValidator.cpp
 *      Legality rules for documents that are about to be stored.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CDocumentValidator.hpp"

#include "errors/CCommandError.hpp"
#include "errors/CErrorMessages.hpp"

#include <bson/bson.h>

#include <cmath>
#include <unordered_set>

namespace StrataDB
{

bool
CDocumentValidator::isValidUtf8(const string& text)
{
    return bson_utf8_validate(text.data(), text.size(), false);
}

void
CDocumentValidator::validate(const CDocument& doc, bool allowNonFinite)
{
    std::unordered_set<string> seen;

    for (const auto& field : doc.fields())
    {
        if (!seen.insert(field.key).second)
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::duplicateKey(field.key));
        validateKey(field.key);
        validateValue(field.key, field.value, allowNonFinite);
    }
}

void
CDocumentValidator::validateKey(const string& key)
{
    if (!isValidUtf8(key))
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::keyInvalidUtf8(key));
    if (key.find('\0') != string::npos)
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::keyContainsNul(key));
    if (!key.empty() && key.front() == '$')
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::keyStartsWithDollar(key));
    if (key.find('.') != string::npos)
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::keyContainsDot(key));
}

void
CDocumentValidator::validateValue(const string& key, const CValue& value,
                                  bool allowNonFinite)
{
    switch (value.type())
    {
    case CValueType::Document:
        validate(value.as<CDocument>(), allowNonFinite);
        break;
    case CValueType::Array:
        validateArray(key, value, allowNonFinite);
        break;
    case CValueType::Double:
    {
        double d = value.as<double>();

        if (allowNonFinite)
            break;
        if (std::isinf(d))
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::infinityValue(key, value));
        if (std::isnan(d))
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::nanValue(key, value));
        break;
    }
    case CValueType::String:
        if (!isValidUtf8(value.as<string>()))
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::invalidUtf8Value(key));
        break;
    default:
        break;
    }
}

void
CDocumentValidator::validateArray(const string& key, const CValue& value,
                                  bool allowNonFinite)
{
    for (const auto& element : value.as<CArray>().values())
    {
        if (element.isArray())
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::nestedArray(key, value));
    }
    for (const auto& element : value.as<CArray>().values())
        validateValue(key, element, allowNonFinite);
}

} // namespace StrataDB
