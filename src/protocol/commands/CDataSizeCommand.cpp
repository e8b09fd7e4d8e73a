/*-------------------------------------------------------------------------
 *
 * CDataSizeCommand.cpp
 *      DataSize command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CDataSizeCommand.hpp"

#include "errors/CErrorMessages.hpp"

#include <chrono>

namespace StrataDB
{

string
CDataSizeCommand::getCommandName() const
{
    return "dataSize";
}

/*
 * execute
 *		The argument is a full "db.collection" name; a missing collection
 *		reports zero sizes instead of an error.
 */
CDocument
CDataSizeCommand::execute(const CommandContext& context)
{
    auto started = std::chrono::steady_clock::now();
    const CValue* nsArg = context.command.get(getCommandName());

    if (!nsArg || !nsArg->isString())
        throw CCommandError(CErrorCode::TypeMismatch,
                            CErrorMessages::wrongType(
                                "dataSize.dataSize",
                                nsArg ? *nsArg : CValue(), "string"));

    const string& ns = nsArg->as<string>();
    size_t dot = ns.find('.');

    if (dot == string::npos || dot == 0 || dot + 1 == ns.size())
        throw CCommandError(CErrorCode::InvalidNamespace,
                            CErrorMessages::invalidNamespaceString(ns));

    string db = ns.substr(0, dot);
    string coll = ns.substr(dot + 1);
    IStorage& storage = context.manager->storage();
    bool exists = storage.collectionExists(db, coll);
    CCollectionStats stats;

    if (exists)
        stats = storage.collectionStats(db, coll);

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - started)
                      .count();
    CDocument reply{{"size", CValue(stats.dataSize)},
                    {"numObjects", CValue(stats.count)},
                    {"millis", CValue(static_cast<int32_t>(millis))}};

    if (exists)
        reply.append("estimate", false);
    return okReply(std::move(reply));
}

} // namespace StrataDB
