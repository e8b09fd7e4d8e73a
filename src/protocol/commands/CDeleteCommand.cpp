/*-------------------------------------------------------------------------
 *
 * CDeleteCommand.cpp
 *      Delete command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CDeleteCommand.hpp"

#include "document/CNumberParam.hpp"
#include "errors/CErrorMessages.hpp"

#include <mutex>

namespace StrataDB
{

string
CDeleteCommand::getCommandName() const
{
    return "delete";
}

vector<DeleteStatement>
CDeleteCommand::parseStatements(const CDocument& command) const
{
    const CArray& deletes = requiredArray(command, "deletes");
    vector<DeleteStatement> statements;

    for (size_t i = 0; i < deletes.size(); i++)
    {
        const CValue& element = deletes.at(i);
        DeleteStatement statement;

        if (!element.isDocument())
            throw CCommandError(
                CErrorCode::TypeMismatch,
                CErrorMessages::wrongType(
                    "delete.deletes." + std::to_string(i), element, "object"));

        const CDocument& doc = element.as<CDocument>();
        const CValue* q = doc.get("q");
        const CValue* limit = doc.get("limit");

        if (!q)
            throw CCommandError(CErrorCode::MissingField,
                                CErrorMessages::missingField("delete.deletes.q"));
        if (!q->isDocument())
            throw CCommandError(CErrorCode::TypeMismatch,
                                CErrorMessages::wrongType("delete.deletes.q",
                                                          *q, "object"));
        if (!limit)
            throw CCommandError(
                CErrorCode::MissingField,
                CErrorMessages::missingField("delete.deletes.limit"));
        if (!limit->isNumber())
            throw CCommandError(
                CErrorCode::TypeMismatch,
                CErrorMessages::wrongTypeNumeric("delete.deletes.limit",
                                                 *limit));

        if (wholeNumber(*limit, statement.limit) != CWholeNumberStatus::Ok ||
            (statement.limit != 0 && statement.limit != 1))
            throw CCommandError(CErrorCode::FailedToParse,
                                CErrorMessages::deleteLimit(*limit));

        statement.query = q->as<CDocument>();
        statements.push_back(std::move(statement));
    }
    return statements;
}

int32_t
CDeleteCommand::runStatement(const CommandContext& context,
                             const string& coll,
                             const DeleteStatement& statement) const
{
    CQueryMatcher matcher(statement.query);
    auto ns = context.manager->namespaceLock(context.databaseName, coll);
    std::lock_guard<std::mutex> guard(ns->writeMutex);

    vector<CRecord> records =
        scan(context, coll, matcher, static_cast<size_t>(statement.limit));
    vector<int64_t> recordIds;

    for (const auto& record : records)
        recordIds.push_back(record.recordId);

    return static_cast<int32_t>(context.manager->storage().deleteDocuments(
        context.databaseName, coll, recordIds));
}

CDocument
CDeleteCommand::execute(const CommandContext& context)
{
    string coll = collectionName(context);
    vector<DeleteStatement> statements = parseStatements(context.command);
    bool ordered = optionalBool(context.command, "ordered", true);
    vector<CWriteError> errors;
    int32_t n = 0;

    for (size_t i = 0; i < statements.size(); i++)
    {
        context.token.check();

        try
        {
            n += runStatement(context, coll, statements[i]);
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

    CDocument reply{{"n", CValue(n)}};

    appendWriteErrors(reply, errors);
    return okReply(std::move(reply));
}

CDocument
CDeleteCommand::explain(const CommandContext& context) const
{
    string coll = collectionName(context);
    CArray parsed;

    for (const auto& statement : parseStatements(context.command))
        parsed.push_back(CQueryMatcher(statement.query).filter());

    return CDocument{
        {"namespace", CValue(fullName(context, coll))},
        {"parsedQuery", CValue(std::move(parsed))},
        {"winningPlan", CValue(CDocument{{"stage", CValue("DELETE")}})}};
}

} // namespace StrataDB
