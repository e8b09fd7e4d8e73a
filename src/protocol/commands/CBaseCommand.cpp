/*-------------------------------------------------------------------------
 *
 * CBaseCommand.cpp
 *      Base class implementation for document database commands
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CBaseCommand.hpp"

#include "document/CNumberParam.hpp"
#include "errors/CErrorMessages.hpp"

namespace StrataDB
{

CDocument
CBaseCommand::explain(const CommandContext& context) const
{
    throw CCommandError(CErrorCode::CommandNotFound,
                        CErrorMessages::explainNotSupported(getCommandName()));
}

CDocument
CBaseCommand::okReply(CDocument reply)
{
    reply.append("ok", 1.0);
    return reply;
}

string
CBaseCommand::collectionName(const CommandContext& context) const
{
    const CValue* value = context.command.get(getCommandName());

    if (!value || !value->isString())
        throw CCommandError(
            CErrorCode::BadValue,
            CErrorMessages::collectionNameType(value ? *value : CValue()));
    return value->as<string>();
}

string
CBaseCommand::fullName(const CommandContext& context, const string& coll)
{
    return context.databaseName + "." + coll;
}

void
CBaseCommand::checkNamespace(const string& db, const string& coll)
{
    try
    {
        CCollectionManager::validateCollectionName(db, coll);
    }
    catch (const CCommandError&)
    {
        throw CCommandError(CErrorCode::InvalidNamespace,
                            CErrorMessages::invalidNamespace(db, coll));
    }
}

void
CBaseCommand::appendWriteErrors(CDocument& reply,
                                const vector<CWriteError>& errors)
{
    if (errors.empty())
        return;

    CArray array;

    for (const auto& error : errors)
        array.push_back(CDocument{
            {"index", CValue(error.index)},
            {"code", CValue(static_cast<int32_t>(error.code))},
            {"errmsg", CValue(error.errmsg)}});
    reply.append("writeErrors", std::move(array));
}

const CDocument*
CBaseCommand::optionalDocument(const CDocument& command,
                               const string& field) const
{
    const CValue* value = command.get(field);

    if (!value || value->isNull())
        return nullptr;
    if (!value->isDocument())
        throw CCommandError(CErrorCode::TypeMismatch,
                            CErrorMessages::wrongType(getCommandName() + "." +
                                                          field,
                                                      *value, "object"));
    return &value->as<CDocument>();
}

const CArray&
CBaseCommand::requiredArray(const CDocument& command,
                            const string& field) const
{
    const CValue* value = command.get(field);
    string qualified = getCommandName() + "." + field;

    if (!value)
        throw CCommandError(CErrorCode::MissingField,
                            CErrorMessages::missingField(qualified));
    if (!value->isArray())
        throw CCommandError(CErrorCode::TypeMismatch,
                            CErrorMessages::wrongType(qualified, *value,
                                                      "array"));
    return value->as<CArray>();
}

bool
CBaseCommand::optionalBool(const CDocument& command, const string& field,
                           bool defaultValue) const
{
    const CValue* value = command.get(field);

    if (!value || value->isNull())
        return defaultValue;
    if (value->is<bool>())
        return value->as<bool>();
    if (value->isNumber())
        return value->toDouble() != 0.0;
    throw CCommandError(CErrorCode::TypeMismatch,
                        CErrorMessages::wrongType(getCommandName() + "." +
                                                      field,
                                                  *value, "bool"));
}

int64_t
CBaseCommand::optionalCount(const CDocument& command,
                            const string& field) const
{
    const CValue* value = command.get(field);

    if (!value)
        return 0;
    return validatedNumberParam(getCommandName(), field, *value, 0);
}

vector<CRecord>
CBaseCommand::scan(const CommandContext& context, const string& coll,
                   const CQueryMatcher& matcher, size_t limit)
{
    IStorage& storage = context.manager->storage();
    size_t batchSize = context.config->scanBatchSize;
    vector<CRecord> result;
    int64_t position = 0;

    if (batchSize == 0)
        batchSize = 1;

    for (;;)
    {
        context.token.check();

        vector<CRecord> batch =
            storage.read(context.databaseName, coll, position, batchSize);

        if (batch.empty())
            return result;

        for (auto& record : batch)
        {
            position = record.recordId;
            if (!matcher.matches(record.document))
                continue;
            result.push_back(std::move(record));
            if (limit != 0 && result.size() >= limit)
                return result;
        }
    }
}

} // namespace StrataDB
