/*-------------------------------------------------------------------------
 *
 * CDropIndexesCommand.cpp
 *      DropIndexes command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CDropIndexesCommand.hpp"

namespace StrataDB
{

string
CDropIndexesCommand::getCommandName() const
{
    return "dropIndexes";
}

CDocument
CDropIndexesCommand::execute(const CommandContext& context)
{
    string coll = collectionName(context);
    CDropIndexesResult result = context.manager->dropIndexes(
        context.databaseName, coll, context.command.get("index"));
    CDocument reply{{"nIndexesWas", CValue(result.nIndexesWas)}};

    if (result.droppedAll)
        reply.append("msg", "non-_id indexes dropped for collection");
    return okReply(std::move(reply));
}

} // namespace StrataDB
