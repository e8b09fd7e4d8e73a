/*-------------------------------------------------------------------------
 *
 * CFindCommand.hpp
 *      Find command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"
#include "query/CProjection.hpp"
#include "query/CQueryMatcher.hpp"
#include "query/CSort.hpp"

namespace StrataDB
{

/* A validated find: everything needed to run it */
struct FindPlan
{
    string collection;
    CDocument filter;
    CQueryMatcher matcher;
    CSort sort;
    CProjection projection;
    bool hasProjection = false;
    int64_t skip = 0;
    int64_t limit = 0;
};

class CFindCommand : public CBaseCommand
{
  public:
    CFindCommand() = default;
    virtual ~CFindCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;
    CDocument explain(const CommandContext& context) const override;

  private:
    FindPlan buildPlan(const CommandContext& context) const;
    vector<CDocument> run(const CommandContext& context,
                          const FindPlan& plan) const;
};

} // namespace StrataDB
