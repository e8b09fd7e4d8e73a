/*-------------------------------------------------------------------------
 *
 * CDropCommand.hpp
 *      Drop command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"

namespace StrataDB
{

class CDropCommand : public CBaseCommand
{
  public:
    CDropCommand() = default;
    virtual ~CDropCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;
};

} // namespace StrataDB
