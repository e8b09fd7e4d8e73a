/*-------------------------------------------------------------------------
 *
 * CDbStatsCommand.cpp
 *      DbStats command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CDbStatsCommand.hpp"

#include "document/CNumberParam.hpp"

namespace StrataDB
{

string
CDbStatsCommand::getCommandName() const
{
    return "dbStats";
}

CDocument
CDbStatsCommand::execute(const CommandContext& context)
{
    const CValue* scaleArg = context.command.get("scale");
    int64_t scale = 1;
    IStorage& storage = context.manager->storage();

    if (scaleArg)
        scale = validatedNumberParam(getCommandName(), "scale", *scaleArg, 1);

    bool freeStorage = optionalBool(context.command, "freeStorage", false);

    vector<CCollectionInfo> collections =
        context.manager->listCollections(context.databaseName);
    int64_t objects = 0;
    int64_t dataSize = 0;
    int64_t indexes = 0;
    int64_t indexSize = 0;

    for (const auto& info : collections)
    {
        context.token.check();

        CCollectionStats stats =
            storage.collectionStats(context.databaseName, info.name);

        objects += stats.count;
        dataSize += stats.dataSize;
        indexes += static_cast<int64_t>(stats.indexSizes.size());
        indexSize += stats.indexSize;
    }

    double divisor = static_cast<double>(scale);
    double avgObjSize =
        objects > 0 ? static_cast<double>(dataSize) / objects : 0.0;

    CDocument reply{
        {"db", CValue(context.databaseName)},
        {"collections", CValue(static_cast<int64_t>(collections.size()))},
        {"views", CValue(int64_t{0})},
        {"objects", CValue(objects)},
        {"avgObjSize", CValue(avgObjSize)},
        {"dataSize", CValue(dataSize / divisor)},
        {"storageSize", CValue(dataSize / divisor)},
        {"indexes", CValue(indexes)},
        {"indexSize", CValue(indexSize / divisor)},
        {"totalSize", CValue((dataSize + indexSize) / divisor)}};

    if (freeStorage)
    {
        reply.append("freeStorageSize", 0.0);
        reply.append("indexFreeStorageSize", 0.0);
        reply.append("totalFreeStorageSize", 0.0);
    }

    reply.append("scaleFactor", CValue(scale));
    return okReply(std::move(reply));
}

} // namespace StrataDB
