/*-------------------------------------------------------------------------
 *
 * CUpdateExecutor.hpp
 *      Update operator and replacement document execution.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CValue.hpp"

namespace StrataDB
{

struct CUpdateResult
{
    CDocument document;
    bool modified = false;
};

/*
 * CUpdateExecutor
 *		An update specification is either a document of $-operators or a
 *		plain replacement document. The specification is validated once
 *		on construction; apply() may then run against any number of
 *		documents.
 */
class CUpdateExecutor
{
  public:
    explicit CUpdateExecutor(const CDocument& spec);

    bool isReplacement() const noexcept
    {
        return replacement_;
    }

    /*
     * Returns the updated copy of doc. $setOnInsert takes effect only
     * when isUpsert is set, i.e. when doc is a freshly seeded document.
     */
    CUpdateResult apply(const CDocument& doc, bool isUpsert) const;

    static CUpdateResult execute(const CDocument& doc, const CDocument& spec,
                                 bool isUpsert);

    CDocument upsertDocument(const CDocument& filter) const;

    /* Document an upsert starts from: the equality fields of the filter */
    static CDocument upsertSeed(const CDocument& filter);

  private:
    void validateOperators() const;
    void validateArrayOperators() const;

    void applySet(CDocument& doc, const CDocument& args,
                  bool setOnInsert) const;
    void applyUnset(CDocument& doc, const CDocument& args) const;
    /* True when a NaN operand forces the document to count as modified */
    bool applyInc(CDocument& doc, const CDocument& args) const;
    void applyMul(CDocument& doc, const CDocument& args) const;
    void applyMinMax(CDocument& doc, const CDocument& args, bool max) const;
    void applyRename(CDocument& doc, const CDocument& args) const;
    void applyCurrentDate(CDocument& doc, const CDocument& args) const;
    void applyPush(CDocument& doc, const CDocument& args, bool unique) const;
    void applyPop(CDocument& doc, const CDocument& args) const;
    void applyPull(CDocument& doc, const CDocument& args, bool all) const;
    void applyBit(CDocument& doc, const CDocument& args) const;

    CDocument spec_;
    bool replacement_ = false;
};

} // namespace StrataDB
