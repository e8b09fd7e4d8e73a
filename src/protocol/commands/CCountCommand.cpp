/*-------------------------------------------------------------------------
 *
 * CCountCommand.cpp
 *      Count command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CCountCommand.hpp"

#include <algorithm>

namespace StrataDB
{

string
CCountCommand::getCommandName() const
{
    return "count";
}

CQueryMatcher
CCountCommand::buildMatcher(const CommandContext& context) const
{
    if (const CDocument* query = optionalDocument(context.command, "query"))
        return CQueryMatcher(*query);
    return CQueryMatcher();
}

CDocument
CCountCommand::execute(const CommandContext& context)
{
    string coll = collectionName(context);
    CQueryMatcher matcher = buildMatcher(context);
    int64_t skip = optionalCount(context.command, "skip");
    int64_t limit = optionalCount(context.command, "limit");
    size_t scanLimit = limit > 0 ? static_cast<size_t>(skip + limit) : 0;

    int64_t matched =
        static_cast<int64_t>(scan(context, coll, matcher, scanLimit).size());
    int64_t n = std::max<int64_t>(0, matched - skip);

    if (limit > 0)
        n = std::min(n, limit);

    return okReply(CDocument{{"n", CValue(static_cast<int32_t>(n))}});
}

CDocument
CCountCommand::explain(const CommandContext& context) const
{
    string coll = collectionName(context);
    CQueryMatcher matcher = buildMatcher(context);

    optionalCount(context.command, "skip");
    optionalCount(context.command, "limit");

    return CDocument{
        {"namespace", CValue(fullName(context, coll))},
        {"parsedQuery", CValue(matcher.filter())},
        {"winningPlan", CValue(CDocument{{"stage", CValue("COUNT")}})}};
}

} // namespace StrataDB
