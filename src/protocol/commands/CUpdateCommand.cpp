/*-------------------------------------------------------------------------
 *
 * CUpdateCommand.cpp
 *      Update command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CUpdateCommand.hpp"

#include "errors/CErrorMessages.hpp"
#include "query/CUpdateExecutor.hpp"

#include <mutex>

namespace StrataDB
{

string
CUpdateCommand::getCommandName() const
{
    return "update";
}

vector<UpdateStatement>
CUpdateCommand::parseStatements(const CDocument& command) const
{
    const CArray& updates = requiredArray(command, "updates");
    vector<UpdateStatement> statements;

    for (size_t i = 0; i < updates.size(); i++)
    {
        const CValue& element = updates.at(i);
        UpdateStatement statement;

        if (!element.isDocument())
            throw CCommandError(
                CErrorCode::TypeMismatch,
                CErrorMessages::wrongType(
                    "update.updates." + std::to_string(i), element, "object"));

        const CDocument& doc = element.as<CDocument>();
        const CValue* q = doc.get("q");
        const CValue* u = doc.get("u");

        if (!q)
            throw CCommandError(CErrorCode::MissingField,
                                CErrorMessages::missingField("update.updates.q"));
        if (!q->isDocument())
            throw CCommandError(CErrorCode::TypeMismatch,
                                CErrorMessages::wrongType("update.updates.q",
                                                          *q, "object"));
        if (!u)
            throw CCommandError(CErrorCode::MissingField,
                                CErrorMessages::missingField("update.updates.u"));
        if (!u->isDocument())
            throw CCommandError(CErrorCode::TypeMismatch,
                                CErrorMessages::wrongType("update.updates.u",
                                                          *u, "object"));

        statement.query = q->as<CDocument>();
        statement.update = u->as<CDocument>();
        statement.upsert = optionalBool(doc, "upsert", false);
        statement.multi = optionalBool(doc, "multi", false);
        statements.push_back(std::move(statement));
    }
    return statements;
}

/*
 * runStatement
 *		Matching, applying and writing back happen under the namespace
 *		write mutex so that concurrent updates cannot lose each other's
 *		changes.
 */
UpdateOutcome
CUpdateCommand::runStatement(const CommandContext& context,
                             const string& coll,
                             const UpdateStatement& statement) const
{
    UpdateOutcome outcome;
    CQueryMatcher matcher(statement.query);
    CUpdateExecutor executor(statement.update);
    IStorage& storage = context.manager->storage();

    if (statement.multi && executor.isReplacement())
        throw CCommandError(CErrorCode::FailedToParse,
                            CErrorMessages::multiUpdateReplacement());

    /* Created before the write mutex; creation takes the catalog mutex */
    if (statement.upsert)
        context.manager->ensureCollection(context.databaseName, coll);

    auto ns = context.manager->namespaceLock(context.databaseName, coll);
    std::lock_guard<std::mutex> guard(ns->writeMutex);

    vector<CRecord> records =
        scan(context, coll, matcher, statement.multi ? 0 : 1);

    for (const auto& record : records)
    {
        CUpdateResult result = executor.apply(record.document, false);

        outcome.matched++;
        if (!result.modified)
            continue;
        if (storage.replaceDocument(context.databaseName, coll,
                                    record.recordId, result.document))
            outcome.modified++;
    }

    if (outcome.matched > 0 || !statement.upsert)
        return outcome;

    CDocument inserted = executor.upsertDocument(statement.query);

    storage.insertDocuments(context.databaseName, coll, {inserted});
    outcome.matched = 1;
    outcome.upsertedId = *inserted.get("_id");
    return outcome;
}

CDocument
CUpdateCommand::execute(const CommandContext& context)
{
    string coll = collectionName(context);
    vector<UpdateStatement> statements = parseStatements(context.command);
    bool ordered = optionalBool(context.command, "ordered", true);
    vector<CWriteError> errors;
    CArray upserted;
    int32_t n = 0;
    int32_t nModified = 0;

    for (size_t i = 0; i < statements.size(); i++)
    {
        context.token.check();

        try
        {
            UpdateOutcome outcome = runStatement(context, coll, statements[i]);

            n += outcome.matched;
            nModified += outcome.modified;
            if (outcome.upsertedId)
                upserted.push_back(CDocument{
                    {"index", CValue(static_cast<int32_t>(i))},
                    {"_id", *outcome.upsertedId}});
        }
        catch (const CCommandError& e)
        {
            if (e.code() == CErrorCode::Interrupted)
                throw;
            errors.push_back(
                CWriteError{static_cast<int32_t>(i), e.code(), e.what()});
            if (ordered)
                break;
        }
    }

    CDocument reply{{"n", CValue(n)}, {"nModified", CValue(nModified)}};

    if (!upserted.empty())
        reply.append("upserted", std::move(upserted));
    appendWriteErrors(reply, errors);
    return okReply(std::move(reply));
}

CDocument
CUpdateCommand::explain(const CommandContext& context) const
{
    string coll = collectionName(context);
    vector<UpdateStatement> statements = parseStatements(context.command);
    CArray parsed;

    for (const auto& statement : statements)
    {
        CQueryMatcher matcher(statement.query);
        CUpdateExecutor executor(statement.update);

        if (statement.multi && executor.isReplacement())
            throw CCommandError(CErrorCode::FailedToParse,
                                CErrorMessages::multiUpdateReplacement());
        parsed.push_back(matcher.filter());
    }

    return CDocument{
        {"namespace", CValue(fullName(context, coll))},
        {"parsedQuery", CValue(std::move(parsed))},
        {"winningPlan", CValue(CDocument{{"stage", CValue("UPDATE")}})}};
}

} // namespace StrataDB
