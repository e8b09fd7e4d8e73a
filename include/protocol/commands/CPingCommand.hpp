/*-------------------------------------------------------------------------
 *
 * CPingCommand.hpp
 *      Ping command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"

namespace StrataDB
{

class CPingCommand : public CBaseCommand
{
  public:
    CPingCommand() = default;
    virtual ~CPingCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;
};

} // namespace StrataDB
