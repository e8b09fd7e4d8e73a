/*-------------------------------------------------------------------------
 *
 * CCreateCommand.cpp
 *      Create command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CCreateCommand.hpp"

namespace StrataDB
{

string
CCreateCommand::getCommandName() const
{
    return "create";
}

CDocument
CCreateCommand::execute(const CommandContext& context)
{
    string coll = collectionName(context);
    CCollectionOptions options =
        CCollectionManager::parseCollectionOptions(context.command);

    context.manager->createCollection(context.databaseName, coll, options);
    return okReply();
}

} // namespace StrataDB
