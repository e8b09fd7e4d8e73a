/*-------------------------------------------------------------------------
 *
 * CFindAndModifyCommand.cpp
 *      FindAndModify command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CFindAndModifyCommand.hpp"

#include "errors/CErrorMessages.hpp"
#include "query/CUpdateExecutor.hpp"

#include <mutex>

namespace StrataDB
{

string
CFindAndModifyCommand::getCommandName() const
{
    return "findAndModify";
}

FindAndModifyRequest
CFindAndModifyCommand::parseRequest(const CDocument& command) const
{
    FindAndModifyRequest request;
    const CValue* update = command.get("update");

    if (const CDocument* query = optionalDocument(command, "query"))
        request.query = *query;
    if (const CDocument* sort = optionalDocument(command, "sort"))
        request.sort = CSort(*sort);
    if (const CDocument* fields = optionalDocument(command, "fields"))
        request.fields = CProjection(*fields);
    request.remove = optionalBool(command, "remove", false);
    request.returnNew = optionalBool(command, "new", false);
    request.upsert = optionalBool(command, "upsert", false);

    if (update && update->isNull())
        update = nullptr;
    if (!update && !request.remove)
        throw CCommandError(CErrorCode::FailedToParse,
                            CErrorMessages::updateOrRemoveRequired());
    if (request.returnNew && request.remove)
        throw CCommandError(CErrorCode::FailedToParse,
                            CErrorMessages::newWithRemove());
    if (update)
    {
        if (update->isArray())
            throw CCommandError(CErrorCode::NotImplemented,
                                CErrorMessages::pipelineUpdateNotSupported());
        if (!update->isDocument())
            throw CCommandError(CErrorCode::FailedToParse,
                                CErrorMessages::updateArgumentType());
        if (request.remove)
            throw CCommandError(CErrorCode::FailedToParse,
                                CErrorMessages::updateWithRemove());
        request.update = update->as<CDocument>();
    }
    if (request.upsert && request.remove)
        throw CCommandError(CErrorCode::FailedToParse,
                            CErrorMessages::upsertWithRemove());
    return request;
}

/* Caller holds the namespace write mutex */
std::optional<CRecord>
CFindAndModifyCommand::findTarget(const CommandContext& context,
                                  const string& coll,
                                  const FindAndModifyRequest& request) const
{
    CQueryMatcher matcher(request.query);
    vector<CRecord> records =
        scan(context, coll, matcher, request.sort.empty() ? 1 : 0);

    if (records.empty())
        return std::nullopt;

    size_t best = 0;

    for (size_t i = 1; i < records.size(); i++)
    {
        if (request.sort.compare(records[i].document,
                                 records[best].document) < 0)
            best = i;
    }
    return records[best];
}

CDocument
CFindAndModifyCommand::execute(const CommandContext& context)
{
    string coll = collectionName(context);
    FindAndModifyRequest request;
    IStorage& storage = context.manager->storage();
    std::optional<CUpdateExecutor> executor;
    CDocument lastError;
    CValue value;

    checkNamespace(context.databaseName, coll);
    request = parseRequest(context.command);
    if (request.update)
        executor.emplace(*request.update);

    /* Created before the write mutex; creation takes the catalog mutex */
    if (request.upsert)
        context.manager->ensureCollection(context.databaseName, coll);

    auto ns = context.manager->namespaceLock(context.databaseName, coll);
    std::lock_guard<std::mutex> guard(ns->writeMutex);
    std::optional<CRecord> target = findTarget(context, coll, request);

    if (request.remove)
    {
        int32_t n = 0;

        if (target && storage.deleteDocuments(context.databaseName, coll,
                                              {target->recordId}) > 0)
        {
            n = 1;
            value = target->document;
        }
        lastError.append("n", CValue(n));
    }
    else if (target)
    {
        CUpdateResult result = executor->apply(target->document, false);
        bool written = !result.modified ||
                       storage.replaceDocument(context.databaseName, coll,
                                               target->recordId,
                                               result.document);

        /* false when a drop removed the record after the scan */
        if (written)
            value = request.returnNew ? result.document : target->document;
        lastError.append("n", CValue(int32_t{written ? 1 : 0}));
        lastError.append("updatedExisting", CValue(written));
    }
    else if (request.upsert)
    {
        CDocument inserted = executor->upsertDocument(request.query);

        storage.insertDocuments(context.databaseName, coll, {inserted});
        lastError.append("n", CValue(int32_t{1}));
        lastError.append("updatedExisting", CValue(false));
        lastError.append("upserted", *inserted.get("_id"));
        if (request.returnNew)
            value = inserted;
    }
    else
    {
        lastError.append("n", CValue(int32_t{0}));
        lastError.append("updatedExisting", CValue(false));
    }

    if (value.isDocument() && request.fields)
        value = request.fields->apply(value.as<CDocument>());

    return okReply(CDocument{{"lastErrorObject", CValue(std::move(lastError))},
                             {"value", std::move(value)}});
}

} // namespace StrataDB
