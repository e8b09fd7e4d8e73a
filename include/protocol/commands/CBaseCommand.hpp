/*-------------------------------------------------------------------------
 *
 * CBaseCommand.hpp
 *      Base class for document database command implementations
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "IDocumentCommand.hpp"
#include "errors/CCommandError.hpp"
#include "query/CQueryMatcher.hpp"
#include "storage/IStorage.hpp"

namespace StrataDB
{

class CBaseCommand : public IDocumentCommand
{
  public:
    virtual ~CBaseCommand() = default;

    /* Commands without an explain form reject it */
    CDocument explain(const CommandContext& context) const override;

  protected:
    /* Appends ok: 1.0 */
    static CDocument okReply(CDocument reply = CDocument());

    /* The string value of the command's first field */
    string collectionName(const CommandContext& context) const;

    static string fullName(const CommandContext& context, const string& coll);

    /* InvalidNamespace "Invalid namespace specified" for illegal names */
    static void checkNamespace(const string& db, const string& coll);

    /* writeErrors: [ { index, code, errmsg } ], only when errors is non-empty */
    static void appendWriteErrors(CDocument& reply,
                                  const vector<CWriteError>& errors);

    /* Argument helpers; absent or null optional arguments return defaults */
    const CDocument* optionalDocument(const CDocument& command,
                                      const string& field) const;
    const CArray& requiredArray(const CDocument& command,
                                const string& field) const;
    bool optionalBool(const CDocument& command, const string& field,
                      bool defaultValue) const;
    int64_t optionalCount(const CDocument& command, const string& field) const;

    /*
     * Scan the collection in batches of scanBatchSize records, checking
     * the cancellation token before every batch. limit 0 means no limit.
     */
    static vector<CRecord> scan(const CommandContext& context,
                                const string& coll,
                                const CQueryMatcher& matcher,
                                size_t limit = 0);
};

} // namespace StrataDB
