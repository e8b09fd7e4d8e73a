/*-------------------------------------------------------------------------
 *
 * CCountCommand.hpp
 *      Count command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"

namespace StrataDB
{

class CCountCommand : public CBaseCommand
{
  public:
    CCountCommand() = default;
    virtual ~CCountCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;
    CDocument explain(const CommandContext& context) const override;

  private:
    CQueryMatcher buildMatcher(const CommandContext& context) const;
};

} // namespace StrataDB
