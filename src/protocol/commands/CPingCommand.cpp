/*-------------------------------------------------------------------------
 *
 * CPingCommand.cpp
 *      Ping command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CPingCommand.hpp"

namespace StrataDB
{

string
CPingCommand::getCommandName() const
{
    return "ping";
}

CDocument
CPingCommand::execute(const CommandContext& context)
{
    /* Ping never touches storage */
    return okReply();
}

} // namespace StrataDB
