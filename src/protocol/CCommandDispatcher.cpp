/*-------------------------------------------------------------------------
 *
 * CCommandDispatcher.cpp
 *      Routes decoded command documents to their handlers.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CCommandDispatcher.hpp"

#include "CLogMacros.hpp"
#include "errors/CErrorMessages.hpp"

#include <format>

namespace StrataDB
{

CCommandDispatcher::CCommandDispatcher(shared_ptr<IStorage> storage,
                                       const CServerConfig& config)
    : config_(config), manager_(std::move(storage), config),
      pool_(std::make_unique<CWorkerPool>(config.workerThreads))
{
}

CCommandDispatcher::~CCommandDispatcher()
{
    pool_->shutdown();
}

void
CCommandDispatcher::setLogger(shared_ptr<ILogger> logger)
{
    logger_ = logger;
    manager_.setLogger(std::move(logger));
}

CDocument
CCommandDispatcher::errorReply(const CCommandError& error)
{
    return CDocument{{"ok", CValue(0.0)},
                     {"code", CValue(error.numericCode())},
                     {"codeName", CValue(error.codeName())},
                     {"errmsg", CValue(string(error.what()))}};
}

CDocument
CCommandDispatcher::execute(const string& database, const CDocument& command,
                            const CCancellationToken& token)
{
    const string& name = command.firstKey();
    IDocumentCommand* handler = registry_.findCommand(name);

    if (!handler)
        throw CCommandError(CErrorCode::CommandNotFound,
                            CErrorMessages::noSuchCommand(name));

    CommandContext context;

    context.databaseName = database;
    if (const CValue* db = command.get("$db"); db && db->isString())
        context.databaseName = db->as<string>();
    context.command = command;
    context.manager = &manager_;
    context.config = &config_;
    context.token = token;
    context.logger = logger_;

    return handler->execute(context);
}

/*
 * dispatch
 *		No exception leaves this function: command errors become error
 *		replies and anything else is reported as InternalError.
 */
CDocument
CCommandDispatcher::dispatch(const string& database, const CDocument& command,
                             const CCancellationToken& token)
{
    debug_log(std::format("dispatch {} on {}", command.firstKey(), database));

    try
    {
        return execute(database, command, token);
    }
    catch (const CCommandError& e)
    {
        debug_log(std::format("{} failed: {} ({})", command.firstKey(),
                              e.what(), e.numericCode()));
        return errorReply(e);
    }
    catch (const std::exception& e)
    {
        error_log(std::format("{} failed: {}", command.firstKey(), e.what()));
        return errorReply(CCommandError(CErrorCode::InternalError, e.what()));
    }
}

std::future<CDocument>
CCommandDispatcher::submit(const string& database, const CDocument& command,
                           const CCancellationToken& token)
{
    return pool_->submit([this, database, command, token]() {
        return dispatch(database, command, token);
    });
}

} // namespace StrataDB
