/*-------------------------------------------------------------------------
 *
 * CErrorMessages.cpp
 *      Text of every externally visible error message.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "errors/CErrorMessages.hpp"

#include "document/CValueFormat.hpp"

#include <format>

namespace StrataDB
{

namespace
{

string
sliceSyntaxTail(size_t count)
{
    return std::format(":: The given syntax did not match the expression "
                       "$slice syntax. :: caused by :: Expression $slice "
                       "takes at least 2 arguments, and at most 3, but {} "
                       "were passed in.",
                       count);
}

} // namespace

string
CErrorMessages::duplicateKey(const string& key)
{
    return std::format("invalid key: \"{}\" (duplicate keys are not allowed)",
                       key);
}

string
CErrorMessages::keyStartsWithDollar(const string& key)
{
    return std::format(
        "invalid key: \"{}\" (key must not start with '$' sign)", key);
}

string
CErrorMessages::keyContainsDot(const string& key)
{
    return std::format("invalid key: \"{}\" (key must not contain '.' sign)",
                       key);
}

string
CErrorMessages::keyInvalidUtf8(const string& key)
{
    return std::format("invalid key: \"{}\" (key contains invalid UTF-8)",
                       key);
}

string
CErrorMessages::keyContainsNul(const string& key)
{
    return std::format(
        "invalid key: \"{}\" (key must not contain '\\0' character)", key);
}

string
CErrorMessages::infinityValue(const string& key, const CValue& value)
{
    return "invalid value: " + renderField(key, value) +
           " (infinity values are not allowed)";
}

string
CErrorMessages::nanValue(const string& key, const CValue& value)
{
    return "invalid value: " + renderField(key, value) +
           " (NaN is not supported)";
}

string
CErrorMessages::nestedArray(const string& key, const CValue& value)
{
    return "invalid value: " + renderField(key, value) +
           " (nested arrays are not supported)";
}

string
CErrorMessages::invalidUtf8Value(const string& key)
{
    return std::format("invalid value: {{ \"{}\": <string> }} (invalid UTF-8)",
                       key);
}

string
CErrorMessages::documentTooLarge(size_t size, size_t maxSize)
{
    return std::format(
        "object to insert too large. size in bytes: {}, max size: {}", size,
        maxSize);
}

string
CErrorMessages::cannotCreateField(const string& segment,
                                  const string& parentKey,
                                  const CValue& parent)
{
    return std::format("Cannot create field '{}' in element {{{}: {}}}",
                       segment, parentKey, formatValue(parent));
}

string
CErrorMessages::emptyUpdatePath()
{
    return "An empty update path is not valid.";
}

string
CErrorMessages::emptyFieldInUpdatePath(const string& path)
{
    return std::format("The update path '{}' contains an empty field name, "
                       "which is not allowed.",
                       path);
}

string
CErrorMessages::cannotTraverse(const string& path)
{
    return std::format("cannot use path '{}' to traverse the document", path);
}

string
CErrorMessages::backfillTooLarge(size_t limit)
{
    return std::format("can't backfill more than {} elements", limit);
}

string
CErrorMessages::modifierNotDocument(const string& op, const CValue& arg)
{
    return std::format("Modifiers operate on fields but we found type {} "
                       "instead. For example: {{$mod: {{<field>: ...}}}} "
                       "not {{{}: {}}}",
                       typeAlias(arg), op, formatValue(arg));
}

string
CErrorMessages::unknownModifier(const string& op)
{
    return std::format("Unknown modifier: {}. Expected a valid update "
                       "modifier or pipeline-style update specified as an "
                       "array",
                       op);
}

string
CErrorMessages::pathConflict(const string& path)
{
    return std::format("Updating the path '{0}' would create a conflict at "
                       "'{0}'",
                       path);
}

string
CErrorMessages::nonNumericArgument(const string& op, const string& key,
                                   const CValue& value)
{
    const char* verb = op == "$mul" ? "multiply" : "increment";

    return std::format("Cannot {} with non-numeric argument: {{{}: {}}}", verb,
                       key, formatValue(value));
}

string
CErrorMessages::nonNumericTarget(const string& op, const CValue& id,
                                 const string& key, const CValue& target)
{
    return std::format("Cannot apply {} to a value of non-numeric type. "
                       "{{_id: {}}} has the field '{}' of non-numeric type {}",
                       op, formatValue(id), key, typeAlias(target));
}

string
CErrorMessages::numericOverflow(const string& op, const CValue& current,
                                const CValue& id)
{
    const char* kind = current.is<int64_t>() ? "NumberLong" : "NumberInt";

    return std::format("Failed to apply {} operations to current value "
                       "(({}){}) for document {{_id: {}}}",
                       op, kind, formatValue(current), formatValue(id));
}

string
CErrorMessages::updateProducesInfinity(const string& path,
                                       const CValue& value)
{
    return "update produces invalid value: " + renderField(path, value) +
           " (update operations that produce infinity values are not "
           "allowed)";
}

string
CErrorMessages::renameTargetNotString(const string& key, const CValue& value)
{
    return std::format("The 'to' field for $rename must be a string: {}: {}",
                       key, formatValue(value));
}

string
CErrorMessages::renameSameField(const string& key)
{
    return std::format("The source and target field for $rename must "
                       "differ: {0}: \"{0}\"",
                       key);
}

string
CErrorMessages::currentDateUnknownOption(const string& option)
{
    return "Unrecognized $currentDate option: " + option;
}

string
CErrorMessages::currentDateBadTypeName()
{
    return "The '$type' string field is required to be 'date' or "
           "'timestamp': {$currentDate: {field : {$type: 'date'}}}";
}

string
CErrorMessages::currentDateBadValue(const CValue& value)
{
    return std::format("{} is not valid type for $currentDate. Please use a "
                       "boolean ('true') or a $type expression ({{$type: "
                       "'timestamp/date'}}).",
                       typeAlias(value));
}

string
CErrorMessages::immutableId(const CValue& id)
{
    return std::format("After applying the update, the (immutable) field "
                       "'_id' was found to have been altered to _id: {}",
                       formatValue(id));
}

string
CErrorMessages::fieldNotArray(const string& key, const CValue& value,
                              const CValue& id)
{
    return std::format("The field '{}' must be an array but is of type '{}' "
                       "in document {{_id: {}}}",
                       key, typeAlias(value), formatValue(id));
}

string
CErrorMessages::pushEachNotArray(const CValue& each)
{
    return std::format("The argument to $each in $push must be an array but "
                       "it was of type: {}",
                       typeAlias(each));
}

string
CErrorMessages::addToSetEachNotArray(const CValue& each)
{
    return std::format("The argument to $each in $addToSet must be an array "
                       "but it was of type {}",
                       typeAlias(each));
}

string
CErrorMessages::popNotNumber(const string& key, const CValue& value)
{
    return std::format("Expected a number in: {}: {}", key,
                       formatValue(value));
}

string
CErrorMessages::popBadDirection(int64_t direction)
{
    return std::format("$pop expects 1 or -1, found: {}", direction);
}

string
CErrorMessages::popNonArray(const string& key, const CValue& value)
{
    return std::format("Path '{}' contains an element of non-array type '{}'",
                       key, typeAlias(value));
}

string
CErrorMessages::pullAllNotArray(const string& key, const CValue& value)
{
    return std::format("The field '{}' must be an array but is of type '{}'",
                       key, typeAlias(value));
}

string
CErrorMessages::pullNonArray()
{
    return "Cannot apply $pull to a non-array value";
}

string
CErrorMessages::bitNotDocument(const CValue& value)
{
    return std::format("The $bit modifier is not compatible with a {}. You "
                       "must pass in an embedded document: "
                       "{{$bit: {{field: {{and/or/xor: #}}}}",
                       typeAlias(value));
}

string
CErrorMessages::bitNoOperation()
{
    return "You must pass in at least one bitwise operation. The format is: "
           "{$bit: {field: {and/or/xor: #}}";
}

string
CErrorMessages::bitUnknownOperation(const string& op, const CValue& value)
{
    return std::format("The $bit modifier only supports 'and', 'or', and "
                       "'xor', not '{}' which is an unknown operator: "
                       "{{{}: {}}}",
                       op, op, formatValue(value));
}

string
CErrorMessages::bitOperandNotIntegral(const string& op, const CValue& value)
{
    return std::format("The $bit modifier field must be an Integer(32/64 "
                       "bit); a '{}' is not supported here: {{{}: {}}}",
                       typeAlias(value), op, formatValue(value));
}

string
CErrorMessages::bitTargetNotIntegral(const CValue& id, const string& key,
                                     const CValue& target)
{
    return std::format("Cannot apply $bit to a value of non-integral type."
                       "_id: {} has the field {} of non-integer type {}",
                       formatValue(id), key, typeAlias(target));
}

string
CErrorMessages::unknownTopLevelOperator(const string& op)
{
    return std::format("unknown top level operator: {}. If you have a field "
                       "name that starts with a '$' symbol, consider using "
                       "$getField or $setField.",
                       op);
}

string
CErrorMessages::unknownOperator(const string& op)
{
    return "unknown operator: " + op;
}

string
CErrorMessages::needsArray(const string& op)
{
    return op + " needs an array";
}

string
CErrorMessages::logicalNeedsArray(const string& op)
{
    return op + " must be an array";
}

string
CErrorMessages::logicalNonEmpty()
{
    return "$and/$or/$nor must be a nonempty array";
}

string
CErrorMessages::logicalEntriesObjects()
{
    return "$or/$and/$nor entries need to be full objects";
}

string
CErrorMessages::regexAsPredicate(const string& field)
{
    return std::format("Can't have RegEx as arg to predicate over field '{}'.",
                       field);
}

string
CErrorMessages::regexAsNe()
{
    return "Can't have regex as arg to $ne.";
}

string
CErrorMessages::cannotNestDollarUnderIn()
{
    return "cannot nest $ under $in";
}

string
CErrorMessages::notNeedsRegexOrDocument()
{
    return "$not needs a regex or a document";
}

string
CErrorMessages::invalidRegexFlag(char flag)
{
    return std::format(" invalid flag in regex options: {}", flag);
}

string
CErrorMessages::regexOptionsTwice()
{
    return "options set in both $regex and $options";
}

string
CErrorMessages::optionsNotString()
{
    return "$options has to be a string";
}

string
CErrorMessages::regexNotString()
{
    return "$regex has to be a string";
}

string
CErrorMessages::optionsWithoutRegex()
{
    return "$options needs a $regex";
}

string
CErrorMessages::invalidRegex(const string& detail)
{
    return "Regular expression is invalid: " + detail;
}

string
CErrorMessages::sizeNotNumber(const CValue& value)
{
    return "Failed to parse $size. Expected a number in: $size: " +
           formatValue(value);
}

string
CErrorMessages::sizeNotInteger(const CValue& value)
{
    return "Failed to parse $size. Expected an integer: $size: " +
           formatValue(value);
}

string
CErrorMessages::sizeNegative(const CValue& value)
{
    return "Failed to parse $size. Expected a non-negative number in: "
           "$size: " +
           formatValue(value);
}

string
CErrorMessages::elemMatchNeedsObject()
{
    return "$elemMatch needs an Object";
}

string
CErrorMessages::unknownTypeAlias(const string& alias)
{
    return "Unknown type name alias: " + alias;
}

string
CErrorMessages::invalidTypeCode(const CValue& value)
{
    return "Invalid numerical type code: " + formatValue(value);
}

string
CErrorMessages::typeNeedsStringOrNumber(const CValue& value)
{
    return "type must be represented as a number or a string, got " +
           typeAlias(value);
}

string
CErrorMessages::modNeedsArray()
{
    return "malformed mod, needs to be an array";
}

string
CErrorMessages::modNotEnoughElements()
{
    return "malformed mod, not enough elements";
}

string
CErrorMessages::modTooManyElements()
{
    return "malformed mod, too many elements";
}

string
CErrorMessages::modDivisorNotNumber()
{
    return "malformed mod, divisor not a number";
}

string
CErrorMessages::modRemainderNotNumber()
{
    return "malformed mod, remainder not a number";
}

string
CErrorMessages::modDivisorZero()
{
    return "divisor cannot be 0";
}

string
CErrorMessages::sliceSingleArgument(const CValue& arg)
{
    return std::format("Invalid $slice syntax. The given syntax {{ $slice: {} "
                       "}} did not match the find() syntax because :: "
                       "Location31273: $slice only supports numbers and "
                       "[skip, limit] arrays ",
                       formatValue(arg)) +
           sliceSyntaxTail(1);
}

string
CErrorMessages::sliceArrayArity(const CValue& arg, size_t count)
{
    return std::format("Invalid $slice syntax. The given syntax {{ $slice: {} "
                       "}} did not match the find() syntax because :: "
                       "Location31272: $slice array argument should be of "
                       "form [skip, limit] ",
                       formatValue(arg)) +
           sliceSyntaxTail(count);
}

string
CErrorMessages::sliceFirstArgument(const CValue& first)
{
    return "First argument to $slice must be an array, but is of type: " +
           typeAlias(first);
}

string
CErrorMessages::exclusionInInclusion(const string& key)
{
    return std::format("Cannot do exclusion on field {} in inclusion "
                       "projection",
                       key);
}

string
CErrorMessages::inclusionInExclusion(const string& key)
{
    return std::format("Cannot do inclusion on field {} in exclusion "
                       "projection",
                       key);
}

string
CErrorMessages::projectionOperatorNotSupported(const CValue& value)
{
    return std::format("projection expression {} is not supported",
                       formatValue(value));
}

string
CErrorMessages::emptyFieldPath()
{
    return "FieldPath cannot be constructed with empty string";
}

string
CErrorMessages::fieldPathStartsWithDollar()
{
    return "FieldPath field names may not start with '$'. Consider using "
           "$getField or $setField.";
}

string
CErrorMessages::fieldPathEmptySegment()
{
    return "FieldPath field names may not be empty strings.";
}

string
CErrorMessages::collectionNameType(const CValue& value)
{
    return "collection name has invalid type " + typeAlias(value);
}

string
CErrorMessages::invalidNamespace(const string& db, const string& coll)
{
    return std::format("Invalid namespace specified '{}.{}'", db, coll);
}

string
CErrorMessages::invalidCollectionName(const string& db, const string& coll)
{
    return std::format("Invalid collection name: '{}.{}'", db, coll);
}

string
CErrorMessages::collectionNameStartsWithDot(const string& coll)
{
    return "Collection names cannot start with '.': " + coll;
}

string
CErrorMessages::collectionExists(const string& db, const string& coll)
{
    return std::format("Collection {}.{} already exists.", db, coll);
}

string
CErrorMessages::namespaceNotFound(const string& db, const string& coll)
{
    return std::format("ns not found {}.{}", db, coll);
}

string
CErrorMessages::namespaceDoesNotExist(const string& db, const string& coll)
{
    return std::format("ns does not exist: {}.{}", db, coll);
}

string
CErrorMessages::invalidNamespaceString(const string& ns)
{
    return std::format("Invalid namespace specified '{}'", ns);
}

string
CErrorMessages::cappedSizeRequired()
{
    return "the 'size' field is required when 'capped' is true";
}

string
CErrorMessages::valueBelowMinimum(const string& field, const string& value,
                                  int64_t minimum)
{
    return std::format("BSON field '{}' value must be >= {}, actual value "
                       "'{}'",
                       field, minimum, value);
}

string
CErrorMessages::wrongTypeNumeric(const string& field, const CValue& value)
{
    return std::format("BSON field '{}' is the wrong type '{}', expected "
                       "types '[long, int, decimal, double]'",
                       field, typeAlias(value));
}

string
CErrorMessages::wrongType(const string& field, const CValue& value,
                          const string& expected)
{
    return std::format("BSON field '{}' is the wrong type '{}', expected "
                       "type '{}'",
                       field, typeAlias(value), expected);
}

string
CErrorMessages::missingField(const string& field)
{
    return std::format("BSON field '{}' is missing but a required field",
                       field);
}

string
CErrorMessages::indexesNull()
{
    return "invalid parameter: expected an object (indexes)";
}

string
CErrorMessages::noIndexes()
{
    return "Must specify at least one index to create";
}

string
CErrorMessages::indexSpecNotObject(size_t position, const CValue& value)
{
    return std::format("BSON field 'createIndexes.indexes.{}' is the wrong "
                       "type '{}', expected type 'object'",
                       position, typeAlias(value));
}

string
CErrorMessages::indexKeyMissing()
{
    return "Error in specification {} :: caused by :: The 'key' field is a "
           "required property of an index specification";
}

string
CErrorMessages::indexKeyNotObject()
{
    return "'key' option must be specified as an object";
}

string
CErrorMessages::indexKeyEmpty()
{
    return "Must specify at least one field for the index key";
}

string
CErrorMessages::idIndexDescending()
{
    return "The field 'key' for an _id index must be {_id: 1}, but got "
           "{ _id: -1 }";
}

string
CErrorMessages::indexNameMissing(const CValue& key)
{
    return std::format("Error in specification {{ key: {} }} :: caused by :: "
                       "The 'name' field is a required property of an index "
                       "specification",
                       formatValue(key));
}

string
CErrorMessages::indexNameNotString()
{
    return "'name' option must be specified as a string";
}

string
CErrorMessages::indexUniqueNotBool(const CValue& key, const string& name,
                                   const CValue& unique)
{
    return std::format("Error in specification {{ key: {0}, name: \"{1}\", "
                       "unique: {2} }} :: caused by :: The field 'unique' has "
                       "value unique: {2}, which is not convertible to bool",
                       formatValue(key), name, formatValue(unique));
}

string
CErrorMessages::idIndexUnique(const CValue& key, const string& name)
{
    return std::format("The field 'unique' is not valid for an _id index "
                       "specification. Specification: {{ key: {}, name: "
                       "\"{}\", unique: true, v: 2 }}",
                       formatValue(key), name);
}

string
CErrorMessages::indexOptionNotImplemented(const string& option)
{
    return std::format("Index option \"{}\" is not implemented yet", option);
}

string
CErrorMessages::indexOptionUnknown(const string& option)
{
    return std::format("Index option \"{}\" is unknown", option);
}

string
CErrorMessages::indexFieldRepeated(const CValue& key, const string& field)
{
    return std::format("Error in specification {}, the field \"{}\" appears "
                       "multiple times",
                       formatValue(key), field);
}

string
CErrorMessages::indexDirectionNotImplemented(const CValue& direction)
{
    return std::format("Index key value \"{}\" is not implemented yet",
                       formatValue(direction));
}

string
CErrorMessages::indexKeyNotFound(const string& field, const CValue& direction)
{
    return std::format("can't find index with key: {{ {}: {} }}", field,
                       formatValue(direction));
}

string
CErrorMessages::indexNameEmpty(const string& key)
{
    return std::format("Error in specification {{ key: {{ {} }}, name: \"\", "
                       "v: 2 }} :: caused by :: index name cannot be empty",
                       key);
}

string
CErrorMessages::idIndexNameReserved(const string& key)
{
    return std::format("The index name '_id_' is reserved for the _id index, "
                       "which must have key pattern {{_id: 1}}, found key: "
                       "{{ {} }}",
                       key);
}

string
CErrorMessages::identicalIndex(const string& name)
{
    return "Identical index already exists: " + name;
}

string
CErrorMessages::indexNameConflict(const string& requestedKey,
                                  const string& requestedName,
                                  const string& existingKey,
                                  const string& existingName)
{
    return std::format(
        "An existing index has the same name as the requested index. When "
        "index names are not specified, they are auto generated and can "
        "cause conflicts. Please refer to our documentation. Requested "
        "index: {{ key: {{ {} }}, name: \"{}\" }}, existing index: {{ key: "
        "{{ {} }}, name: \"{}\" }}",
        requestedKey, requestedName, existingKey, existingName);
}

string
CErrorMessages::indexKeyConflict(const string& existingName)
{
    return "Index already exists with a different name: " + existingName;
}

string
CErrorMessages::cannotDropIdIndex()
{
    return "cannot drop _id index";
}

string
CErrorMessages::indexNotFoundWithKey(const string& key)
{
    return std::format("can't find index with key: {{ {} }}", key);
}

string
CErrorMessages::indexNotFoundWithName(const string& name)
{
    return std::format("index not found with name [{}]", name);
}

string
CErrorMessages::dropIndexWrongType(const CValue& value)
{
    return std::format("BSON field 'dropIndexes.index' is the wrong type "
                       "'{}', expected types '[string, object]'",
                       typeAlias(value));
}

string
CErrorMessages::sortIllegalKey(const string& key, const CValue& value)
{
    return std::format("Illegal key in $sort specification: {}: {}", key,
                       formatValue(value));
}

string
CErrorMessages::sortNotWholeNumber()
{
    return "$sort must be a whole number";
}

string
CErrorMessages::sortBadOrder()
{
    return "$sort key ordering must be 1 (for ascending) or -1 (for "
           "descending)";
}

string
CErrorMessages::invalidBson(const string& detail)
{
    return "invalid BSON: " + detail;
}

string
CErrorMessages::unsupportedBsonType(int typeCode)
{
    return std::format("unsupported BSON type 0x{:02x}", typeCode);
}

string
CErrorMessages::noSuchCommand(const string& name)
{
    return std::format("no such command: '{}'", name);
}

string
CErrorMessages::duplicateKeyError(const string& db, const string& coll)
{
    return std::format("E11000 duplicate key error collection: {}.{}", db,
                       coll);
}

string
CErrorMessages::interrupted()
{
    return "operation was interrupted";
}

string
CErrorMessages::explainNotSupported(const string& name)
{
    return std::format("Explain is not supported for command '{}'", name);
}

string
CErrorMessages::multiUpdateReplacement()
{
    return "multi update is not supported for replacement-style update";
}

string
CErrorMessages::deleteLimit(const CValue& limit)
{
    return "The limit field in delete objects must be 0 or 1. Got " +
           formatValue(limit);
}

string
CErrorMessages::updateOrRemoveRequired()
{
    return "Either an update or remove=true must be specified";
}

string
CErrorMessages::newWithRemove()
{
    return "Cannot specify both new=true and remove=true; 'remove' always "
           "returns the deleted document";
}

string
CErrorMessages::updateWithRemove()
{
    return "Cannot specify both an update and remove=true";
}

string
CErrorMessages::upsertWithRemove()
{
    return "Cannot specify both upsert=true and remove=true";
}

string
CErrorMessages::pipelineUpdateNotSupported()
{
    return "Aggregation pipelines are not supported yet";
}

string
CErrorMessages::updateArgumentType()
{
    return "Update argument must be either an object or an array";
}

} // namespace StrataDB
