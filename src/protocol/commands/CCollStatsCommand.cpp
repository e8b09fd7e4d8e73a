/*-------------------------------------------------------------------------
 *
 * CCollStatsCommand.cpp
 *      CollStats command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CCollStatsCommand.hpp"

#include "document/CNumberParam.hpp"
#include "errors/CErrorMessages.hpp"

namespace StrataDB
{

string
CCollStatsCommand::getCommandName() const
{
    return "collStats";
}

/*
 * execute
 *		Sizes are divided by scale; the in-memory backend reports no
 *		free space and uses the data size as its storage size.
 */
CDocument
CCollStatsCommand::execute(const CommandContext& context)
{
    string coll = collectionName(context);
    const CValue* scaleArg = context.command.get("scale");
    int64_t scale = 1;
    IStorage& storage = context.manager->storage();

    if (scaleArg)
        scale = validatedNumberParam(getCommandName(), "scale", *scaleArg, 1);

    vector<CCollectionInfo> collections =
        context.manager->listCollections(context.databaseName);
    const CCollectionInfo* info = nullptr;

    for (const auto& candidate : collections)
    {
        if (candidate.name == coll)
            info = &candidate;
    }
    if (!info)
        throw CCommandError(
            CErrorCode::NamespaceNotFound,
            CErrorMessages::namespaceNotFound(context.databaseName, coll));

    CCollectionStats stats = storage.collectionStats(context.databaseName, coll);
    CDocument indexSizes;

    for (const auto& [name, size] : stats.indexSizes)
        indexSizes.append(name, CValue(size / scale));

    CDocument reply{{"ns", CValue(fullName(context, coll))},
                    {"size", CValue(stats.dataSize / scale)},
                    {"count", CValue(stats.count)}};

    if (stats.count > 0)
        reply.append("avgObjSize", CValue(stats.dataSize / stats.count));

    reply.append("storageSize", CValue(stats.dataSize / scale));
    reply.append("freeStorageSize", CValue(int64_t{0}));
    reply.append("nindexes",
                 CValue(static_cast<int64_t>(stats.indexSizes.size())));
    reply.append("totalIndexSize", CValue(stats.indexSize / scale));
    reply.append("totalSize",
                 CValue((stats.dataSize + stats.indexSize) / scale));
    reply.append("indexSizes", std::move(indexSizes));
    reply.append("scaleFactor", CValue(static_cast<int32_t>(scale)));
    reply.append("capped", info->options.capped);

    if (info->options.capped)
    {
        reply.append("max", CValue(info->options.max));
        reply.append("maxSize", CValue(info->options.size / scale));
    }

    return okReply(std::move(reply));
}

} // namespace StrataDB
