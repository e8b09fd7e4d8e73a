/*-------------------------------------------------------------------------
 *
 * CUpdateCommand.hpp
 *      Update command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"

#include <optional>

namespace StrataDB
{

/* One element of the updates array */
struct UpdateStatement
{
    CDocument query;
    CDocument update;
    bool upsert = false;
    bool multi = false;
};

struct UpdateOutcome
{
    int32_t matched = 0;
    int32_t modified = 0;
    std::optional<CValue> upsertedId;
};

class CUpdateCommand : public CBaseCommand
{
  public:
    CUpdateCommand() = default;
    virtual ~CUpdateCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;
    CDocument explain(const CommandContext& context) const override;

  private:
    vector<UpdateStatement> parseStatements(const CDocument& command) const;
    UpdateOutcome runStatement(const CommandContext& context,
                               const string& coll,
                               const UpdateStatement& statement) const;
};

} // namespace StrataDB
