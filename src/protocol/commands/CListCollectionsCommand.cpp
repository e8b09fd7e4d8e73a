/*-------------------------------------------------------------------------
 *
 * CListCollectionsCommand.cpp
 *      ListCollections command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CListCollectionsCommand.hpp"

namespace StrataDB
{

string
CListCollectionsCommand::getCommandName() const
{
    return "listCollections";
}

CDocument
CListCollectionsCommand::execute(const CommandContext& context)
{
    CQueryMatcher matcher;
    bool nameOnly = optionalBool(context.command, "nameOnly", false);
    CArray firstBatch;

    if (const CDocument* filter = optionalDocument(context.command, "filter"))
        matcher = CQueryMatcher(*filter);

    for (const auto& info :
         context.manager->listCollections(context.databaseName))
    {
        CDocument options;

        if (info.options.capped)
        {
            options.append("capped", true);
            options.append("size", CValue(info.options.size));
            if (info.options.max > 0)
                options.append("max", CValue(info.options.max));
        }

        CDocument entry{{"name", CValue(info.name)},
                        {"type", CValue("collection")},
                        {"options", CValue(std::move(options))},
                        {"info", CValue(CDocument{{"readOnly", false}})}};

        if (!matcher.matches(entry))
            continue;
        if (nameOnly)
            entry = CDocument{{"name", CValue(info.name)},
                              {"type", CValue("collection")}};
        firstBatch.push_back(std::move(entry));
    }

    CDocument cursor{
        {"id", CValue(int64_t{0})},
        {"ns", CValue(context.databaseName + ".$cmd.listCollections")},
        {"firstBatch", CValue(std::move(firstBatch))}};

    return okReply(CDocument{{"cursor", CValue(std::move(cursor))}});
}

} // namespace StrataDB
