/*-------------------------------------------------------------------------
 *
 * CExplainCommand.cpp
 *      Explain command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CExplainCommand.hpp"

#include "commands/CCommandRegistry.hpp"
#include "errors/CErrorMessages.hpp"

namespace StrataDB
{

CExplainCommand::CExplainCommand(const CCommandRegistry& registry)
    : registry_(registry)
{
}

string
CExplainCommand::getCommandName() const
{
    return "explain";
}

CDocument
CExplainCommand::execute(const CommandContext& context)
{
    const CValue* wrapped = context.command.get(getCommandName());

    if (!wrapped || !wrapped->isDocument())
        throw CCommandError(CErrorCode::TypeMismatch,
                            CErrorMessages::wrongType(
                                "explain.explain",
                                wrapped ? *wrapped : CValue(), "object"));

    const CDocument& command = wrapped->as<CDocument>();
    const string& name = command.firstKey();
    IDocumentCommand* target = registry_.findCommand(name);

    if (!target)
        throw CCommandError(CErrorCode::CommandNotFound,
                            CErrorMessages::noSuchCommand(name));

    CommandContext inner = context;

    inner.command = command;

    /* The collection name must be a valid namespace even when unused */
    if (const CValue* coll = command.get(name); coll && coll->isString())
        checkNamespace(context.databaseName, coll->as<string>());

    CDocument queryPlanner = target->explain(inner);

    return okReply(CDocument{{"queryPlanner", CValue(std::move(queryPlanner))},
                             {"command", CValue(command)}});
}

} // namespace StrataDB
