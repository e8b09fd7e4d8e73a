/*-------------------------------------------------------------------------
 *
 * CInsertCommand.cpp
 *      Insert command implementation for document database
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CInsertCommand.hpp"

#include "document/CDocumentValidator.hpp"
#include "errors/CErrorMessages.hpp"
#include "protocol/CBsonCodec.hpp"

namespace StrataDB
{

string
CInsertCommand::getCommandName() const
{
    return "insert";
}

CDocument
CInsertCommand::prepareDocument(const CommandContext& context,
                                const CDocument& doc) const
{
    CDocument prepared = doc;
    const CValue* id = doc.get("_id");

    if (id)
    {
        CValue value = *id;

        prepared.remove("_id");
        prepared.prepend("_id", std::move(value));
    }
    else
        prepared.prepend("_id", CObjectId::generate());

    CDocumentValidator::validate(prepared);

    size_t size = CBsonCodec::encodedSize(prepared);

    if (size > context.config->maxDocumentSize)
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::documentTooLarge(
                                size, context.config->maxDocumentSize));
    return prepared;
}

/*
 * insertOne
 *		A concurrent drop can remove the collection between the implicit
 *		create and the write; the collection is then created again once.
 */
void
CInsertCommand::insertOne(const CommandContext& context, const string& coll,
                          const CDocument& doc) const
{
    IStorage& storage = context.manager->storage();

    try
    {
        storage.insertDocuments(context.databaseName, coll, {doc});
    }
    catch (const CCommandError& e)
    {
        if (e.code() != CErrorCode::NamespaceNotFound)
            throw;
        context.manager->ensureCollection(context.databaseName, coll);
        storage.insertDocuments(context.databaseName, coll, {doc});
    }
}

CDocument
CInsertCommand::execute(const CommandContext& context)
{
    string coll = collectionName(context);
    const CArray& documents = requiredArray(context.command, "documents");
    bool ordered = optionalBool(context.command, "ordered", true);
    vector<CWriteError> errors;
    int32_t inserted = 0;

    for (size_t i = 0; i < documents.size(); i++)
    {
        if (!documents.at(i).isDocument())
            throw CCommandError(
                CErrorCode::TypeMismatch,
                CErrorMessages::wrongType(
                    "insert.documents." + std::to_string(i), documents.at(i),
                    "object"));
    }

    context.manager->ensureCollection(context.databaseName, coll);

    for (size_t i = 0; i < documents.size(); i++)
    {
        context.token.check();

        try
        {
            CDocument doc =
                prepareDocument(context, documents.at(i).as<CDocument>());

            insertOne(context, coll, doc);
            inserted++;
        }
        catch (const CCommandError& e)
        {
            errors.push_back(
                CWriteError{static_cast<int32_t>(i), e.code(), e.what()});
            if (ordered)
                break;
        }
    }

    CDocument reply{{"n", CValue(inserted)}};

    appendWriteErrors(reply, errors);
    return okReply(std::move(reply));
}

} // namespace StrataDB
