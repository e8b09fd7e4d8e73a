/*-------------------------------------------------------------------------
 *
 * CFindCommand.cpp
 *      Find command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CFindCommand.hpp"

#include <algorithm>

namespace StrataDB
{

string
CFindCommand::getCommandName() const
{
    return "find";
}

/*
 * buildPlan
 *		Every argument is validated here, before storage is touched, so an
 *		invalid query fails against a missing collection too.
 */
FindPlan
CFindCommand::buildPlan(const CommandContext& context) const
{
    FindPlan plan;
    const CDocument& command = context.command;

    plan.collection = collectionName(context);
    checkNamespace(context.databaseName, plan.collection);

    if (const CDocument* filter = optionalDocument(command, "filter"))
    {
        plan.filter = *filter;
        plan.matcher = CQueryMatcher(*filter);
    }
    if (const CDocument* sort = optionalDocument(command, "sort"))
        plan.sort = CSort(*sort);
    if (const CDocument* projection = optionalDocument(command, "projection"))
    {
        plan.projection = CProjection(*projection);
        plan.hasProjection = !projection->empty();
    }
    plan.skip = optionalCount(command, "skip");
    plan.limit = optionalCount(command, "limit");
    return plan;
}

vector<CDocument>
CFindCommand::run(const CommandContext& context, const FindPlan& plan) const
{
    size_t scanLimit = 0;

    /* Without a sort the scan can stop once skip + limit matched */
    if (plan.sort.empty() && plan.limit > 0)
        scanLimit = static_cast<size_t>(plan.skip + plan.limit);

    vector<CRecord> records =
        scan(context, plan.collection, plan.matcher, scanLimit);
    vector<CDocument> docs;

    docs.reserve(records.size());
    for (auto& record : records)
        docs.push_back(std::move(record.document));

    plan.sort.apply(docs);

    size_t begin = std::min(docs.size(), static_cast<size_t>(plan.skip));
    size_t end = docs.size();

    if (plan.limit > 0)
        end = std::min(end, begin + static_cast<size_t>(plan.limit));

    vector<CDocument> result;

    for (size_t i = begin; i < end; i++)
        result.push_back(plan.hasProjection ? plan.projection.apply(docs[i])
                                            : std::move(docs[i]));
    return result;
}

CDocument
CFindCommand::execute(const CommandContext& context)
{
    FindPlan plan = buildPlan(context);
    CArray firstBatch;

    for (auto& doc : run(context, plan))
        firstBatch.push_back(std::move(doc));

    CDocument cursor{
        {"firstBatch", CValue(std::move(firstBatch))},
        {"id", CValue(int64_t{0})},
        {"ns", CValue(fullName(context, plan.collection))}};

    return okReply(CDocument{{"cursor", CValue(std::move(cursor))}});
}

CDocument
CFindCommand::explain(const CommandContext& context) const
{
    FindPlan plan = buildPlan(context);

    return CDocument{
        {"namespace", CValue(fullName(context, plan.collection))},
        {"parsedQuery", CValue(plan.filter)},
        {"winningPlan", CValue(CDocument{{"stage", CValue("COLLSCAN")}})}};
}

} // namespace StrataDB
