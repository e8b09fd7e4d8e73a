/*-------------------------------------------------------------------------
 *
 * CFindAndModifyCommand.hpp
 *      FindAndModify command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBaseCommand.hpp"
#include "query/CProjection.hpp"
#include "query/CSort.hpp"

#include <optional>

namespace StrataDB
{

struct FindAndModifyRequest
{
    CDocument query;
    CSort sort;
    std::optional<CDocument> update;
    std::optional<CProjection> fields;
    bool remove = false;
    bool returnNew = false;
    bool upsert = false;
};

/*
 * CFindAndModifyCommand
 *		Updates or removes the first document the query matches, in sort
 *		order when a sort is given, and returns it.
 */
class CFindAndModifyCommand : public CBaseCommand
{
  public:
    CFindAndModifyCommand() = default;
    virtual ~CFindAndModifyCommand() = default;

    string getCommandName() const override;
    CDocument execute(const CommandContext& context) override;

  private:
    FindAndModifyRequest parseRequest(const CDocument& command) const;
    std::optional<CRecord> findTarget(const CommandContext& context,
                                      const string& coll,
                                      const FindAndModifyRequest& request) const;
};

} // namespace StrataDB
