/*-------------------------------------------------------------------------
 *
 * CDeleteCommand.hpp
 *      Delete command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"

namespace StrataDB
{

/* One element of the deletes array; limit is 0 (all) or 1 */
struct DeleteStatement
{
    CDocument query;
    int64_t limit = 0;
};

class CDeleteCommand : public CBaseCommand
{
  public:
    CDeleteCommand() = default;
    virtual ~CDeleteCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;
    CDocument explain(const CommandContext& context) const override;

  private:
    vector<DeleteStatement> parseStatements(const CDocument& command) const;
    int32_t runStatement(const CommandContext& context, const string& coll,
                         const DeleteStatement& statement) const;
};

} // namespace StrataDB
