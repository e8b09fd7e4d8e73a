/*-------------------------------------------------------------------------
 *
 * CCreateIndexesCommand.cpp
 *      CreateIndexes command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CCreateIndexesCommand.hpp"

namespace StrataDB
{

string
CCreateIndexesCommand::getCommandName() const
{
    return "createIndexes";
}

CDocument
CCreateIndexesCommand::execute(const CommandContext& context)
{
    string coll = collectionName(context);
    CCreateIndexesResult result = context.manager->createIndexes(
        context.databaseName, coll, context.command.get("indexes"));
    CDocument reply{{"numIndexesBefore", CValue(result.numIndexesBefore)},
                    {"numIndexesAfter", CValue(result.numIndexesAfter)}};

    if (result.allExisted)
        reply.append("note", "all indexes already exist");
    else
        reply.append("createdCollectionAutomatically",
                     result.createdCollectionAutomatically);
    return okReply(std::move(reply));
}

} // namespace StrataDB
