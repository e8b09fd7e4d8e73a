/*-------------------------------------------------------------------------
 *
 * CListIndexesCommand.cpp
 *      ListIndexes command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CListIndexesCommand.hpp"

namespace StrataDB
{

string
CListIndexesCommand::getCommandName() const
{
    return "listIndexes";
}

CDocument
CListIndexesCommand::execute(const CommandContext& context)
{
    string coll = collectionName(context);
    CArray firstBatch;

    for (const auto& index :
         context.manager->listIndexes(context.databaseName, coll))
    {
        CDocument entry{{"v", CValue(int32_t{2})},
                        {"key", CValue(index.key)},
                        {"name", CValue(index.name)}};

        /* _id_ is implicitly unique and never reported as such */
        if (index.unique && index.name != "_id_")
            entry.append("unique", true);
        firstBatch.push_back(std::move(entry));
    }

    CDocument cursor{{"id", CValue(int64_t{0})},
                     {"ns", CValue(fullName(context, coll))},
                     {"firstBatch", CValue(std::move(firstBatch))}};

    return okReply(CDocument{{"cursor", CValue(std::move(cursor))}});
}

} // namespace StrataDB
