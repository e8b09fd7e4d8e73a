/*-------------------------------------------------------------------------
 *
 * CDocumentValidator.hpp
 *      Legality rules for documents that are about to be stored.
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
 * CDocumentValidator
 *		Walks a document depth first and throws CCommandError(BadValue) for
 *		the first violation. For each field the key is checked before the
 *		value, and fields are visited in stored order.
 */
class CDocumentValidator
{
  public:
    /*
     * Values produced by update operators may legally hold NaN and
     * infinities; pass allowNonFinite for those.
     */
    static void validate(const CDocument& doc, bool allowNonFinite = false);

    /* Value checks only, reported against the given key */
    static void validateValue(const string& key, const CValue& value,
                              bool allowNonFinite = false);

    static bool isValidUtf8(const string& text);

  private:
    static void validateKey(const string& key);
    static void validateArray(const string& key, const CValue& value,
                              bool allowNonFinite);
};

} // namespace StrataDB
