/*-------------------------------------------------------------------------
 *
 * CUpdateExecutor.cpp
 *      Update operator and replacement document execution.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "query/CUpdateExecutor.hpp"

#include "document/CDocumentValidator.hpp"
#include "document/CNumberParam.hpp"
#include "document/CPath.hpp"
#include "document/CValueCompare.hpp"
#include "query/CQueryMatcher.hpp"
#include "errors/CCommandError.hpp"
#include "errors/CErrorMessages.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <limits>
#include <optional>
#include <unordered_set>

namespace StrataDB
{

namespace
{

const char* const kOperators[] = {
    "$addToSet", "$bit",  "$currentDate", "$inc",         "$max",
    "$min",      "$mul",  "$pop",         "$pull",        "$pullAll",
    "$push",     "$rename", "$set",       "$setOnInsert", "$unset"};

bool
isKnownOperator(const string& key)
{
    for (const char* op : kOperators)
    {
        if (key == op)
            return true;
    }
    return false;
}

vector<string>
sortedKeys(const CDocument& doc)
{
    vector<string> keys = doc.keys();

    std::sort(keys.begin(), keys.end());
    return keys;
}

const CValue&
documentId(const CDocument& doc)
{
    static const CValue missing;
    const CValue* id = doc.get("_id");

    return id ? *id : missing;
}

string
lastSegment(const string& path)
{
    size_t dot = path.rfind('.');

    return dot == string::npos ? path : path.substr(dot + 1);
}

/* Kinds $inc and $mul can do arithmetic on */
bool
isArithmetic(const CValue& value)
{
    return value.is<double>() || value.is<int32_t>() || value.is<int64_t>();
}

int64_t
integral(const CValue& value)
{
    return value.is<int32_t>() ? value.as<int32_t>() : value.as<int64_t>();
}

bool
addOverflows(int64_t a, int64_t b, int64_t& out)
{
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    constexpr int64_t min = std::numeric_limits<int64_t>::min();

    if ((b > 0 && a > max - b) || (b < 0 && a < min - b))
        return true;
    out = a + b;
    return false;
}

bool
mulOverflows(int64_t a, int64_t b, int64_t& out)
{
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    constexpr int64_t min = std::numeric_limits<int64_t>::min();

    if (a > 0)
    {
        if ((b > 0 && a > max / b) || (b < 0 && b < min / a))
            return true;
    }
    else if (a < 0)
    {
        if ((b > 0 && a < min / b) || (b < 0 && b < max / a))
            return true;
    }
    out = a * b;
    return false;
}

/*
 * combineNumbers
 *		A double operand makes the result a double. Two int32 operands
 *		stay int32 unless the result no longer fits, in which case it is
 *		widened to int64. Overflowing int64 is an error.
 */
CValue
combineNumbers(const string& op, const CValue& current, const CValue& arg,
               const CValue& id)
{
    bool mul = op == "$mul";
    int64_t result = 0;

    if (current.is<double>() || arg.is<double>())
    {
        double a = current.toDouble();
        double b = arg.toDouble();

        return CValue(mul ? a * b : a + b);
    }

    bool overflow = mul ? mulOverflows(integral(current), integral(arg), result)
                        : addOverflows(integral(current), integral(arg), result);

    if (overflow)
        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::numericOverflow(op, current, id));
    if (current.is<int32_t>() && arg.is<int32_t>() &&
        result >= std::numeric_limits<int32_t>::min() &&
        result <= std::numeric_limits<int32_t>::max())
        return CValue(static_cast<int32_t>(result));
    return CValue(result);
}

bool
isIntegral(const CValue& value)
{
    return value.is<int32_t>() || value.is<int64_t>();
}

/* $push and $addToSet take either one value or {$each: [...]} */
const CValue*
eachArgument(const CValue& value)
{
    if (!value.isDocument())
        return nullptr;
    return value.as<CDocument>().get("$each");
}

vector<CValue>
pushedValues(const CValue& value)
{
    if (const CValue* each = eachArgument(value))
        return each->as<CArray>().values();
    return vector<CValue>{value};
}

/* Direction argument of $pop, or nullopt when not a whole number */
std::optional<int64_t>
popDirection(const CValue& value)
{
    int64_t direction = 0;

    if (wholeNumber(value, direction) != CWholeNumberStatus::Ok)
        return std::nullopt;
    return direction;
}

/* {$gt: 3} style condition against a single array element */
bool
pullMatches(const CValue& element, const CValue& condition)
{
    if (condition.isDocument())
    {
        const auto& cond = condition.as<CDocument>();

        if (!cond.empty() && !cond.firstKey().empty() &&
            cond.firstKey().front() == '$')
            return CQueryMatcher::match(CDocument{{"v", element}},
                                        CDocument{{"v", condition}});
    }
    return compareValues(element, condition) == 0;
}

CValue
applyBitOperation(const string& op, const CValue& current,
                  const CValue& operand)
{
    int64_t a = integral(current);
    int64_t b = integral(operand);
    int64_t result = op == "and" ? (a & b) : op == "or" ? (a | b) : (a ^ b);

    if (current.is<int32_t>() && operand.is<int32_t>())
        return CValue(static_cast<int32_t>(result));
    return CValue(result);
}

CValue
zeroLike(const CValue& value)
{
    if (value.is<double>())
        return CValue(0.0);
    if (value.is<int64_t>())
        return CValue(int64_t{0});
    return CValue(int32_t{0});
}

CTimestamp
nextTimestamp(std::chrono::system_clock::time_point now)
{
    static std::atomic<uint32_t> increment{0};
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch());

    return CTimestamp{static_cast<uint32_t>(seconds.count()), ++increment};
}

} // namespace

CUpdateExecutor::CUpdateExecutor(const CDocument& spec) : spec_(spec)
{
    replacement_ = true;
    for (const auto& field : spec_.fields())
    {
        if (!field.key.empty() && field.key.front() == '$')
            replacement_ = false;
    }
    if (!replacement_)
        validateOperators();
}

/*
 * validateOperators
 *		Operator arguments are checked first (kind and duplicate keys),
 *		then paths across all operators, then the $currentDate and
 *		$rename arguments.
 */
void
CUpdateExecutor::validateOperators() const
{
    static const char* const extractOrder[] = {
        "$currentDate", "$inc",     "$max",  "$min",         "$mul",
        "$set",         "$unset",   "$setOnInsert",           "$rename",
        "$push",        "$addToSet", "$pop", "$pull",        "$pullAll",
        "$bit"};
    static const char* const pathOrder[] = {
        "$currentDate", "$inc",     "$min",  "$max",         "$mul",
        "$set",         "$setOnInsert",      "$unset",       "$push",
        "$addToSet",    "$pop",     "$pull", "$pullAll",     "$bit"};
    vector<string> visited;

    for (const auto& field : spec_.fields())
    {
        if (!isKnownOperator(field.key))
            throw CCommandError(CErrorCode::FailedToParse,
                                CErrorMessages::unknownModifier(field.key));
    }

    for (const char* op : extractOrder)
    {
        const CValue* arg = spec_.get(op);
        std::unordered_set<string> keys;

        if (!arg)
            continue;
        if (!arg->isDocument())
            throw CCommandError(CErrorCode::FailedToParse,
                                CErrorMessages::modifierNotDocument(op, *arg));
        for (const auto& field : arg->as<CDocument>().fields())
        {
            if (!keys.insert(field.key).second)
                throw CCommandError(CErrorCode::ConflictingUpdateOperators,
                                    CErrorMessages::pathConflict(field.key));
        }
    }

    for (const char* op : pathOrder)
    {
        const CValue* arg = spec_.get(op);

        if (!arg)
            continue;
        for (const auto& field : arg->as<CDocument>().fields())
        {
            if (field.key.empty())
                throw CCommandError(CErrorCode::EmptyFieldName,
                                    CErrorMessages::emptyUpdatePath());
            if (CPath::hasEmptySegment(field.key))
                throw CCommandError(
                    CErrorCode::EmptyFieldName,
                    CErrorMessages::emptyFieldInUpdatePath(field.key));
            for (const auto& seen : visited)
            {
                if (CPath::overlaps(seen, field.key))
                    throw CCommandError(
                        CErrorCode::ConflictingUpdateOperators,
                        CErrorMessages::pathConflict(field.key));
            }
            visited.push_back(field.key);
        }
    }

    if (const CValue* currentDate = spec_.get("$currentDate"))
    {
        for (const auto& field : currentDate->as<CDocument>().fields())
        {
            const CValue& value = field.value;

            if (value.is<bool>())
                continue;
            if (!value.isDocument())
                throw CCommandError(
                    CErrorCode::BadValue,
                    CErrorMessages::currentDateBadValue(value));

            const auto& options = value.as<CDocument>();

            for (const auto& option : options.fields())
            {
                if (option.key != "$type")
                    throw CCommandError(
                        CErrorCode::BadValue,
                        CErrorMessages::currentDateUnknownOption(option.key));
            }

            const CValue* type = options.get("$type");

            if (type && (!type->isString() || (type->as<string>() != "date" &&
                                               type->as<string>() !=
                                                   "timestamp")))
                throw CCommandError(CErrorCode::BadValue,
                                    CErrorMessages::currentDateBadTypeName());
        }
    }

    validateArrayOperators();

    if (const CValue* rename = spec_.get("$rename"))
    {
        std::unordered_set<string> paths;

        for (const auto& field : rename->as<CDocument>().fields())
        {
            if (field.key.empty())
                throw CCommandError(CErrorCode::EmptyFieldName,
                                    CErrorMessages::emptyUpdatePath());
            if (CPath::hasEmptySegment(field.key))
                throw CCommandError(
                    CErrorCode::EmptyFieldName,
                    CErrorMessages::emptyFieldInUpdatePath(field.key));
            if (!field.value.isString())
                throw CCommandError(CErrorCode::BadValue,
                                    CErrorMessages::renameTargetNotString(
                                        field.key, field.value));

            const string& target = field.value.as<string>();

            if (target.empty())
                throw CCommandError(CErrorCode::EmptyFieldName,
                                    CErrorMessages::emptyUpdatePath());
            if (target == field.key)
                throw CCommandError(CErrorCode::BadValue,
                                    CErrorMessages::renameSameField(field.key));
            if (!paths.insert(field.key).second)
                throw CCommandError(CErrorCode::ConflictingUpdateOperators,
                                    CErrorMessages::pathConflict(field.key));
            if (!paths.insert(target).second)
                throw CCommandError(CErrorCode::ConflictingUpdateOperators,
                                    CErrorMessages::pathConflict(target));
        }
    }
}

/*
 * validateArrayOperators
 *		Arguments of the array operators and $bit that can be checked
 *		without looking at a document.
 */
void
CUpdateExecutor::validateArrayOperators() const
{
    static const char* const eachOperators[] = {"$push", "$addToSet"};

    for (const char* op : eachOperators)
    {
        const CValue* arg = spec_.get(op);

        if (!arg)
            continue;
        for (const auto& field : arg->as<CDocument>().fields())
        {
            const CValue* each = eachArgument(field.value);

            if (!each || each->isArray())
                continue;
            if (string(op) == "$push")
                throw CCommandError(CErrorCode::BadValue,
                                    CErrorMessages::pushEachNotArray(*each));
            throw CCommandError(CErrorCode::TypeMismatch,
                                CErrorMessages::addToSetEachNotArray(*each));
        }
    }

    if (const CValue* pop = spec_.get("$pop"))
    {
        for (const auto& field : pop->as<CDocument>().fields())
        {
            auto direction = popDirection(field.value);

            if (!direction)
                throw CCommandError(
                    CErrorCode::FailedToParse,
                    CErrorMessages::popNotNumber(field.key, field.value));
            if (*direction != 1 && *direction != -1)
                throw CCommandError(CErrorCode::FailedToParse,
                                    CErrorMessages::popBadDirection(*direction));
        }
    }

    if (const CValue* pullAll = spec_.get("$pullAll"))
    {
        for (const auto& field : pullAll->as<CDocument>().fields())
        {
            if (!field.value.isArray())
                throw CCommandError(
                    CErrorCode::BadValue,
                    CErrorMessages::pullAllNotArray(field.key, field.value));
        }
    }

    if (const CValue* bit = spec_.get("$bit"))
    {
        for (const auto& field : bit->as<CDocument>().fields())
        {
            if (!field.value.isDocument())
                throw CCommandError(CErrorCode::BadValue,
                                    CErrorMessages::bitNotDocument(field.value));

            const auto& ops = field.value.as<CDocument>();

            if (ops.empty())
                throw CCommandError(CErrorCode::BadValue,
                                    CErrorMessages::bitNoOperation());
            for (const auto& op : ops.fields())
            {
                if (op.key != "and" && op.key != "or" && op.key != "xor")
                    throw CCommandError(
                        CErrorCode::BadValue,
                        CErrorMessages::bitUnknownOperation(op.key, op.value));
                if (!isIntegral(op.value))
                    throw CCommandError(
                        CErrorCode::BadValue,
                        CErrorMessages::bitOperandNotIntegral(op.key,
                                                              op.value));
            }
        }
    }
}

CUpdateResult
CUpdateExecutor::apply(const CDocument& doc, bool isUpsert) const
{
    CUpdateResult result{doc, false};
    const CValue* id = doc.get("_id");
    bool forced = false;

    if (replacement_)
    {
        CDocument replaced = spec_;
        const CValue* newId = replaced.get("_id");

        if (id)
        {
            if (newId && !identical(*id, *newId))
                throw CCommandError(CErrorCode::ImmutableField,
                                    CErrorMessages::immutableId(*newId));
            replaced.remove("_id");
            replaced.prepend("_id", *id);
        }
        CDocumentValidator::validate(replaced);
        result.document = std::move(replaced);
        result.modified = !identical(doc, result.document);
        return result;
    }

    for (const auto& field : spec_.fields())
    {
        const string& op = field.key;
        const CDocument& args = field.value.as<CDocument>();

        if (op == "$set")
            applySet(result.document, args, false);
        else if (op == "$setOnInsert")
        {
            if (isUpsert)
                applySet(result.document, args, true);
        }
        else if (op == "$unset")
            applyUnset(result.document, args);
        else if (op == "$inc")
            forced = applyInc(result.document, args) || forced;
        else if (op == "$mul")
            applyMul(result.document, args);
        else if (op == "$min")
            applyMinMax(result.document, args, false);
        else if (op == "$max")
            applyMinMax(result.document, args, true);
        else if (op == "$rename")
            applyRename(result.document, args);
        else if (op == "$currentDate")
            applyCurrentDate(result.document, args);
        else if (op == "$push")
            applyPush(result.document, args, false);
        else if (op == "$addToSet")
            applyPush(result.document, args, true);
        else if (op == "$pop")
            applyPop(result.document, args);
        else if (op == "$pull")
            applyPull(result.document, args, false);
        else if (op == "$pullAll")
            applyPull(result.document, args, true);
        else if (op == "$bit")
            applyBit(result.document, args);
    }

    if (id)
    {
        const CValue* after = result.document.get("_id");

        if (!after || !identical(*id, *after))
            throw CCommandError(CErrorCode::ImmutableField,
                                CErrorMessages::immutableId(
                                    after ? *after : CValue()));
    }

    CDocumentValidator::validate(result.document, true);
    result.modified = forced || !identical(doc, result.document);
    return result;
}

CUpdateResult
CUpdateExecutor::execute(const CDocument& doc, const CDocument& spec,
                         bool isUpsert)
{
    return CUpdateExecutor(spec).apply(doc, isUpsert);
}

/*
 * applySet
 *		Keys are applied in sorted order and identical values are left
 *		alone. $setOnInsert never writes null, an empty array or a dotted
 *		path.
 */
void
CUpdateExecutor::applySet(CDocument& doc, const CDocument& args,
                          bool setOnInsert) const
{
    for (const auto& key : sortedKeys(args))
    {
        const CValue& value = *args.get(key);
        const CValue* current = CPath::get(doc, key);

        if (setOnInsert)
        {
            if (value.isNull())
                continue;
            if (value.isArray() && value.as<CArray>().empty())
                continue;
        }
        if (current && identical(*current, value))
            continue;
        if (setOnInsert && key.find('.') != string::npos)
            continue;
        CPath::set(doc, key, value);
    }
}

void
CUpdateExecutor::applyUnset(CDocument& doc, const CDocument& args) const
{
    for (const auto& field : args.fields())
    {
        if (CPath::has(doc, field.key))
            CPath::remove(doc, field.key);
    }
}

bool
CUpdateExecutor::applyInc(CDocument& doc, const CDocument& args) const
{
    bool forced = false;

    for (const auto& field : args.fields())
    {
        const CValue& arg = field.value;
        const CValue* current = CPath::get(doc, field.key);

        if (!isArithmetic(arg))
            throw CCommandError(
                CErrorCode::TypeMismatch,
                CErrorMessages::nonNumericArgument("$inc", field.key, arg));
        if (!current)
        {
            CPath::set(doc, field.key, arg);
            continue;
        }
        if (!isArithmetic(*current))
            throw CCommandError(CErrorCode::TypeMismatch,
                                CErrorMessages::nonNumericTarget(
                                    "$inc", documentId(doc),
                                    lastSegment(field.key), *current));

        if (current->is<double>() && std::isnan(current->as<double>()))
            forced = true;

        CValue result = combineNumbers("$inc", *current, arg, documentId(doc));

        CPath::set(doc, field.key, std::move(result));
    }
    return forced;
}

void
CUpdateExecutor::applyMul(CDocument& doc, const CDocument& args) const
{
    for (const auto& field : args.fields())
    {
        const CValue& arg = field.value;
        const CValue* current = CPath::get(doc, field.key);

        if (!isArithmetic(arg))
            throw CCommandError(
                CErrorCode::TypeMismatch,
                CErrorMessages::nonNumericArgument("$mul", field.key, arg));
        if (!current)
        {
            CPath::set(doc, field.key, zeroLike(arg));
            continue;
        }
        if (!isArithmetic(*current))
            throw CCommandError(CErrorCode::TypeMismatch,
                                CErrorMessages::nonNumericTarget(
                                    "$mul", documentId(doc),
                                    lastSegment(field.key), *current));

        CValue result = combineNumbers("$mul", *current, arg, documentId(doc));

        if (result.is<double>() && std::isinf(result.as<double>()))
            throw CCommandError(
                CErrorCode::BadValue,
                CErrorMessages::updateProducesInfinity(field.key, result));
        CPath::set(doc, field.key, std::move(result));
    }
}

void
CUpdateExecutor::applyMinMax(CDocument& doc, const CDocument& args,
                             bool max) const
{
    for (const auto& key : sortedKeys(args))
    {
        const CValue& value = *args.get(key);
        const CValue* current = CPath::get(doc, key);

        if (current)
        {
            int cmp = compareValues(*current, value);

            if (max ? cmp >= 0 : cmp <= 0)
                continue;
        }
        CPath::set(doc, key, value);
    }
}

void
CUpdateExecutor::applyRename(CDocument& doc, const CDocument& args) const
{
    for (const auto& key : sortedKeys(args))
    {
        const CValue* source = CPath::get(doc, key);

        if (!source)
            continue;

        CValue moved = *source;

        CPath::remove(doc, key);
        CPath::set(doc, args.get(key)->as<string>(), std::move(moved));
    }
}

void
CUpdateExecutor::applyCurrentDate(CDocument& doc, const CDocument& args) const
{
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch());

    for (const auto& key : sortedKeys(args))
    {
        const CValue& value = *args.get(key);
        const CValue* type =
            value.isDocument() ? value.as<CDocument>().get("$type") : nullptr;

        if (type && type->as<string>() == "timestamp")
            CPath::set(doc, key, nextTimestamp(now));
        else
            CPath::set(doc, key, CDateTime{millis.count()});
    }
}

/*
 * applyPush
 *		A missing field becomes a new array. With unique set ($addToSet)
 *		values already present in the array are skipped.
 */
void
CUpdateExecutor::applyPush(CDocument& doc, const CDocument& args,
                           bool unique) const
{
    for (const auto& field : args.fields())
    {
        const CValue* current = CPath::get(doc, field.key);
        CArray array;

        if (current)
        {
            if (!current->isArray())
                throw CCommandError(CErrorCode::BadValue,
                                    CErrorMessages::fieldNotArray(
                                        field.key, *current, documentId(doc)));
            array = current->as<CArray>();
        }
        for (auto& value : pushedValues(field.value))
        {
            if (unique)
            {
                const auto& values = array.values();
                bool present = std::any_of(
                    values.begin(), values.end(), [&](const CValue& existing) {
                        return compareValues(existing, value) == 0;
                    });

                if (present)
                    continue;
            }
            array.push_back(std::move(value));
        }
        CPath::set(doc, field.key, CValue(std::move(array)));
    }
}

void
CUpdateExecutor::applyPop(CDocument& doc, const CDocument& args) const
{
    for (const auto& field : args.fields())
    {
        const CValue* current = CPath::get(doc, field.key);

        if (!current)
            continue;
        if (!current->isArray())
            throw CCommandError(CErrorCode::TypeMismatch,
                                CErrorMessages::popNonArray(field.key,
                                                            *current));

        CArray array = current->as<CArray>();

        if (array.empty())
            continue;
        array.erase(*popDirection(field.value) == -1 ? 0 : array.size() - 1);
        CPath::set(doc, field.key, CValue(std::move(array)));
    }
}

/*
 * applyPull
 *		$pull removes every element equal to the argument, or matching it
 *		when the argument is an operator condition. $pullAll removes every
 *		element equal to any value of its array.
 */
void
CUpdateExecutor::applyPull(CDocument& doc, const CDocument& args,
                           bool all) const
{
    for (const auto& field : args.fields())
    {
        const CValue* current = CPath::get(doc, field.key);

        if (!current)
            continue;
        if (!current->isArray())
        {
            if (all)
                throw CCommandError(CErrorCode::BadValue,
                                    CErrorMessages::fieldNotArray(
                                        field.key, *current, documentId(doc)));
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::pullNonArray());
        }

        CArray array = current->as<CArray>();
        auto& values = array.values();

        values.erase(
            std::remove_if(values.begin(), values.end(),
                           [&](const CValue& element) {
                               if (!all)
                                   return pullMatches(element, field.value);
                               for (const auto& v :
                                    field.value.as<CArray>().values())
                               {
                                   if (compareValues(element, v) == 0)
                                       return true;
                               }
                               return false;
                           }),
            values.end());
        CPath::set(doc, field.key, CValue(std::move(array)));
    }
}

/* A missing field starts from int32 zero */
void
CUpdateExecutor::applyBit(CDocument& doc, const CDocument& args) const
{
    for (const auto& field : args.fields())
    {
        const CValue* current = CPath::get(doc, field.key);
        CValue value = current ? *current : CValue(int32_t{0});

        if (!isIntegral(value))
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::bitTargetNotIntegral(
                                    documentId(doc), lastSegment(field.key),
                                    value));
        for (const auto& op : field.value.as<CDocument>().fields())
            value = applyBitOperation(op.key, value, op.value);
        CPath::set(doc, field.key, std::move(value));
    }
}

/*
 * upsertDocument
 *		The document an upsert inserts when its filter matched nothing;
 *		_id comes first and is generated when neither the filter nor the
 *		update supplies one.
 */
CDocument
CUpdateExecutor::upsertDocument(const CDocument& filter) const
{
    CDocument seed = upsertSeed(filter);
    CDocument inserted;

    if (replacement_)
    {
        inserted = apply(CDocument(), true).document;
        if (const CValue* id = seed.get("_id"); id && !inserted.has("_id"))
            inserted.prepend("_id", *id);
    }
    else
        inserted = apply(seed, true).document;

    if (const CValue* id = inserted.get("_id"))
    {
        CValue value = *id;

        inserted.remove("_id");
        inserted.prepend("_id", std::move(value));
    }
    else
        inserted.prepend("_id", CObjectId::generate());
    return inserted;
}

/*
 * upsertSeed
 *		Equality conditions of the filter, including those under $and and
 *		explicit $eq, become the fields of the document an upsert inserts.
 */
CDocument
CUpdateExecutor::upsertSeed(const CDocument& filter)
{
    CDocument seed;

    for (const auto& field : filter.fields())
    {
        const string& key = field.key;
        const CValue& value = field.value;

        if (!key.empty() && key.front() == '$')
        {
            if (key != "$and" || !value.isArray())
                continue;
            for (const auto& entry : value.as<CArray>().values())
            {
                if (!entry.isDocument())
                    continue;

                CDocument nested = upsertSeed(entry.as<CDocument>());

                for (const auto& sub : nested.fields())
                    CPath::set(seed, sub.key, sub.value);
            }
            continue;
        }
        if (value.is<CRegex>())
            continue;
        if (value.isDocument() && !value.as<CDocument>().empty() &&
            !value.as<CDocument>().firstKey().empty() &&
            value.as<CDocument>().firstKey().front() == '$')
        {
            if (const CValue* eq = value.as<CDocument>().get("$eq"))
                CPath::set(seed, key, *eq);
            continue;
        }
        CPath::set(seed, key, value);
    }
    return seed;
}

} // namespace StrataDB
