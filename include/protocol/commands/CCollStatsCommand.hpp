/*-------------------------------------------------------------------------
 *
 * CCollStatsCommand.hpp
 *      CollStats command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"

namespace StrataDB
{

class CCollStatsCommand : public CBaseCommand
{
  public:
    CCollStatsCommand() = default;
    virtual ~CCollStatsCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;
};

} // namespace StrataDB
