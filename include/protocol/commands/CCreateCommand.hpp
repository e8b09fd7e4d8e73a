/*-------------------------------------------------------------------------
 *
 * CCreateCommand.hpp
 *      Create command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"

namespace StrataDB
{

class CCreateCommand : public CBaseCommand
{
  public:
    CCreateCommand() = default;
    virtual ~CCreateCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;
};

} // namespace StrataDB
