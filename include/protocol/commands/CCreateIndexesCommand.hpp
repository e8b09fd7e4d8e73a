/*-------------------------------------------------------------------------
 *
 * CCreateIndexesCommand.hpp
 *      CreateIndexes command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"

namespace StrataDB
{

class CCreateIndexesCommand : public CBaseCommand
{
  public:
    CCreateIndexesCommand() = default;
    virtual ~CCreateIndexesCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;
};

} // namespace StrataDB
