/*-------------------------------------------------------------------------
 *
 * CListIndexesCommand.hpp
 *      ListIndexes command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"

namespace StrataDB
{

class CListIndexesCommand : public CBaseCommand
{
  public:
    CListIndexesCommand() = default;
    virtual ~CListIndexesCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;
};

} // namespace StrataDB
