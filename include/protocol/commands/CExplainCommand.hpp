/*-------------------------------------------------------------------------
 *
 * CExplainCommand.hpp
 *      Explain command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"

namespace StrataDB
{

class CCommandRegistry;

/*
 * CExplainCommand
 *		Validates the wrapped command through its own explain() and
 *		reports the plan without executing it.
 */
class CExplainCommand : public CBaseCommand
{
  public:
    explicit CExplainCommand(const CCommandRegistry& registry);
    virtual ~CExplainCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;

  private:
    const CCommandRegistry& registry_;
};

} // namespace StrataDB
