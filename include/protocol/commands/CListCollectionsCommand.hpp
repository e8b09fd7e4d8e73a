/*-------------------------------------------------------------------------
 *
 * CListCollectionsCommand.hpp
 *      ListCollections command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"

namespace StrataDB
{

class CListCollectionsCommand : public CBaseCommand
{
  public:
    CListCollectionsCommand() = default;
    virtual ~CListCollectionsCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;
};

} // namespace StrataDB
