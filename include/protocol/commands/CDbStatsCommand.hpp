/*-------------------------------------------------------------------------
 *
 * CDbStatsCommand.hpp
 *      DbStats command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"

namespace StrataDB
{

class CDbStatsCommand : public CBaseCommand
{
  public:
    CDbStatsCommand() = default;
    virtual ~CDbStatsCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;
};

} // namespace StrataDB
