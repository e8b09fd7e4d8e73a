/*-------------------------------------------------------------------------
 *
 * CDataSizeCommand.hpp
 *      DataSize command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"

namespace StrataDB
{

class CDataSizeCommand : public CBaseCommand
{
  public:
    CDataSizeCommand() = default;
    virtual ~CDataSizeCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;
};

} // namespace StrataDB
