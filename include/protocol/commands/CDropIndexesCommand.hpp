/*-------------------------------------------------------------------------
 *
 * CDropIndexesCommand.hpp
 *      DropIndexes command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"

namespace StrataDB
{

class CDropIndexesCommand : public CBaseCommand
{
  public:
    CDropIndexesCommand() = default;
    virtual ~CDropIndexesCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;
};

} // namespace StrataDB
