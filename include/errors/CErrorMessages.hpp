/*-------------------------------------------------------------------------
 *
 * CErrorMessages.hpp
 *      Text of every externally visible error message.
 *
 *      Clients compare these strings literally, so they are built in one
 *      place only. Callers pair them with the matching CErrorCode.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CValue.hpp"

#include <string>

namespace StrataDB
{

class CErrorMessages
{
  public:
    /* Document validation */
    static string duplicateKey(const string& key);
    static string keyStartsWithDollar(const string& key);
    static string keyContainsDot(const string& key);
    static string keyInvalidUtf8(const string& key);
    static string keyContainsNul(const string& key);
    static string infinityValue(const string& key, const CValue& value);
    static string nanValue(const string& key, const CValue& value);
    static string nestedArray(const string& key, const CValue& value);
    static string invalidUtf8Value(const string& key);
    static string documentTooLarge(size_t size, size_t maxSize);

    /* Paths */
    static string cannotCreateField(const string& segment,
                                    const string& parentKey,
                                    const CValue& parent);
    static string emptyUpdatePath();
    static string emptyFieldInUpdatePath(const string& path);
    static string cannotTraverse(const string& path);
    static string backfillTooLarge(size_t limit);

    /* Update operators */
    static string modifierNotDocument(const string& op, const CValue& arg);
    static string unknownModifier(const string& op);
    static string pathConflict(const string& path);
    static string nonNumericArgument(const string& op, const string& key,
                                     const CValue& value);
    static string nonNumericTarget(const string& op, const CValue& id,
                                   const string& key, const CValue& target);
    static string numericOverflow(const string& op, const CValue& current,
                                  const CValue& id);
    static string updateProducesInfinity(const string& path,
                                         const CValue& value);
    static string renameTargetNotString(const string& key,
                                        const CValue& value);
    static string renameSameField(const string& key);
    static string currentDateUnknownOption(const string& option);
    static string currentDateBadTypeName();
    static string currentDateBadValue(const CValue& value);
    static string immutableId(const CValue& id);

    /* Array update operators */
    static string fieldNotArray(const string& key, const CValue& value,
                                const CValue& id);
    static string pushEachNotArray(const CValue& each);
    static string addToSetEachNotArray(const CValue& each);
    static string popNotNumber(const string& key, const CValue& value);
    static string popBadDirection(int64_t direction);
    static string popNonArray(const string& key, const CValue& value);
    static string pullAllNotArray(const string& key, const CValue& value);
    static string pullNonArray();
    static string bitNotDocument(const CValue& value);
    static string bitNoOperation();
    static string bitUnknownOperation(const string& op, const CValue& value);
    static string bitOperandNotIntegral(const string& op, const CValue& value);
    static string bitTargetNotIntegral(const CValue& id, const string& key,
                                       const CValue& target);

    /* Query filter */
    static string unknownTopLevelOperator(const string& op);
    static string unknownOperator(const string& op);
    static string needsArray(const string& op);
    static string logicalNeedsArray(const string& op);
    static string logicalNonEmpty();
    static string logicalEntriesObjects();
    static string regexAsPredicate(const string& field);
    static string regexAsNe();
    static string cannotNestDollarUnderIn();
    static string notNeedsRegexOrDocument();
    static string invalidRegexFlag(char flag);
    static string regexOptionsTwice();
    static string optionsNotString();
    static string regexNotString();
    static string optionsWithoutRegex();
    static string invalidRegex(const string& detail);
    static string sizeNotNumber(const CValue& value);
    static string sizeNotInteger(const CValue& value);
    static string sizeNegative(const CValue& value);
    static string elemMatchNeedsObject();
    static string unknownTypeAlias(const string& alias);
    static string invalidTypeCode(const CValue& value);
    static string typeNeedsStringOrNumber(const CValue& value);
    static string modNeedsArray();
    static string modNotEnoughElements();
    static string modTooManyElements();
    static string modDivisorNotNumber();
    static string modRemainderNotNumber();
    static string modDivisorZero();

    /* Projection */
    static string sliceSingleArgument(const CValue& arg);
    static string sliceArrayArity(const CValue& arg, size_t count);
    static string sliceFirstArgument(const CValue& first);
    static string exclusionInInclusion(const string& key);
    static string inclusionInExclusion(const string& key);
    static string projectionOperatorNotSupported(const CValue& value);
    static string emptyFieldPath();
    static string fieldPathStartsWithDollar();
    static string fieldPathEmptySegment();

    /* Collections and indexes */
    static string collectionNameType(const CValue& value);
    static string invalidNamespace(const string& db, const string& coll);
    static string invalidCollectionName(const string& db,
                                        const string& coll);
    static string collectionNameStartsWithDot(const string& coll);
    static string collectionExists(const string& db, const string& coll);
    static string namespaceNotFound(const string& db, const string& coll);
    static string namespaceDoesNotExist(const string& db, const string& coll);
    static string invalidNamespaceString(const string& ns);
    static string cappedSizeRequired();
    static string valueBelowMinimum(const string& field, const string& value,
                                    int64_t minimum);
    static string wrongTypeNumeric(const string& field, const CValue& value);
    static string wrongType(const string& field, const CValue& value,
                            const string& expected);
    static string missingField(const string& field);
    static string indexesNull();
    static string noIndexes();
    static string indexSpecNotObject(size_t position, const CValue& value);
    static string indexKeyMissing();
    static string indexKeyNotObject();
    static string indexKeyEmpty();
    static string idIndexDescending();
    static string indexNameMissing(const CValue& key);
    static string indexNameNotString();
    static string indexUniqueNotBool(const CValue& key, const string& name,
                                     const CValue& unique);
    static string idIndexUnique(const CValue& key, const string& name);
    static string indexOptionNotImplemented(const string& option);
    static string indexOptionUnknown(const string& option);
    static string indexFieldRepeated(const CValue& key, const string& field);
    static string indexDirectionNotImplemented(const CValue& direction);
    static string indexKeyNotFound(const string& field,
                                   const CValue& direction);
    static string indexNameEmpty(const string& key);
    static string idIndexNameReserved(const string& key);
    static string identicalIndex(const string& name);
    static string indexNameConflict(const string& requestedKey,
                                    const string& requestedName,
                                    const string& existingKey,
                                    const string& existingName);
    static string indexKeyConflict(const string& existingName);
    static string cannotDropIdIndex();
    static string indexNotFoundWithKey(const string& key);
    static string indexNotFoundWithName(const string& name);
    static string dropIndexWrongType(const CValue& value);

    /* Sort */
    static string sortIllegalKey(const string& key, const CValue& value);
    static string sortNotWholeNumber();
    static string sortBadOrder();

    /* Encoding */
    static string invalidBson(const string& detail);
    static string unsupportedBsonType(int typeCode);

    /* Commands */
    static string noSuchCommand(const string& name);
    static string duplicateKeyError(const string& db, const string& coll);
    static string interrupted();
    static string explainNotSupported(const string& name);
    static string multiUpdateReplacement();
    static string deleteLimit(const CValue& limit);
    static string updateOrRemoveRequired();
    static string newWithRemove();
    static string updateWithRemove();
    static string upsertWithRemove();
    static string pipelineUpdateNotSupported();
    static string updateArgumentType();
};

} // namespace StrataDB
