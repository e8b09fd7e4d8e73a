/*-------------------------------------------------------------------------
 *
 * CInsertCommand.hpp
 *      Insert command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"

namespace StrataDB
{

class CInsertCommand : public CBaseCommand
{
  public:
    CInsertCommand() = default;
    virtual ~CInsertCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;

  private:
    /* _id first, generated when absent; then validated and size checked */
    CDocument prepareDocument(const CommandContext& context,
                              const CDocument& doc) const;
    void insertOne(const CommandContext& context, const string& coll,
                   const CDocument& doc) const;
};

} // namespace StrataDB
