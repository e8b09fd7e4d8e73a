/*-------------------------------------------------------------------------
 *
 * CDropCommand.cpp
 *      Drop command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CDropCommand.hpp"

#include "errors/CErrorMessages.hpp"

namespace StrataDB
{

string
CDropCommand::getCommandName() const
{
    return "drop";
}

CDocument
CDropCommand::execute(const CommandContext& context)
{
    string coll = collectionName(context);
    CCollectionManager& manager = *context.manager;
    auto indexes = static_cast<int32_t>(
        manager.storage().listIndexes(context.databaseName, coll).size());

    if (!manager.dropCollection(context.databaseName, coll))
        throw CCommandError(
            CErrorCode::NamespaceNotFound,
            CErrorMessages::namespaceNotFound(context.databaseName, coll));

    return okReply(CDocument{{"nIndexesWas", CValue(indexes)},
                             {"ns", CValue(fullName(context, coll))}});
}

} // namespace StrataDB
