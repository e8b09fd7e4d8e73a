/*-------------------------------------------------------------------------
 *
 * CCollectionManager.cpp
 *      Collection and index lifecycle for StrataDB.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "catalog/CCollectionManager.hpp"

#include "CLogMacros.hpp"
#include "document/CDocumentValidator.hpp"
#include "document/CNumberParam.hpp"
#include "document/CValueFormat.hpp"
#include "errors/CCommandError.hpp"
#include "errors/CErrorMessages.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <set>

namespace StrataDB
{

namespace
{

const string idIndexName = "_id_";

/* Index options accepted by the protocol that this server does not build */
const std::set<string> unimplementedIndexOptions = {
    "sparse",
    "partialFilterExpression",
    "expireAfterSeconds",
    "hidden",
    "storageEngine",
    "weights",
    "default_language",
    "language_override",
    "textIndexVersion",
    "2dsphereIndexVersion",
    "bits",
    "min",
    "max",
    "bucketSize",
    "collation",
    "wildcardProjection"};

bool
isIdIndexKey(const CDocument& key)
{
    return CCollectionManager::formatIndexKey(key) == "_id: 1";
}

/*
 * Positive size options of a capped collection. Fractions are floored;
 * anything at or below zero is rejected.
 */
int64_t
positiveSizeOption(const string& field, const CValue& value)
{
    if (!value.isNumber())
        throw CCommandError(
            CErrorCode::TypeMismatch,
            CErrorMessages::wrongTypeNumeric("create." + field, value));

    double d = value.toDouble();

    if (std::isnan(d) || d < 1.0)
    {
        int64_t shown = std::isnan(d) ? 0 : static_cast<int64_t>(std::ceil(d));

        if (value.is<int64_t>())
            shown = value.as<int64_t>();
        throw CCommandError(
            CErrorCode::Location51024,
            CErrorMessages::valueBelowMinimum(field, std::to_string(shown), 1));
    }
    if (value.is<int32_t>())
        return value.as<int32_t>();
    if (value.is<int64_t>())
        return value.as<int64_t>();
    if (d >= 9223372036854775807.0)
        return std::numeric_limits<int64_t>::max();
    return static_cast<int64_t>(std::floor(d));
}

} // namespace

CCollectionManager::CCollectionManager(shared_ptr<IStorage> storage,
                                       const CServerConfig& config)
    : storage_(std::move(storage)), config_(config)
{
}

void
CCollectionManager::setLogger(shared_ptr<ILogger> logger)
{
    logger_ = std::move(logger);
}

/*
 * validateCollectionName
 *		A leading '.' has its own message; every other violation of
 *		^[^.$\0][^$\0]{0,234}$ or invalid UTF-8 is "Invalid collection name".
 */
void
CCollectionManager::validateCollectionName(const string& db,
                                           const string& coll)
{
    if (!coll.empty() && coll.front() == '.')
        throw CCommandError(CErrorCode::InvalidNamespace,
                            CErrorMessages::collectionNameStartsWithDot(coll));

    bool valid = !coll.empty() && coll.size() <= 235 &&
                 coll.find_first_of(string("$\0", 2)) == string::npos &&
                 CDocumentValidator::isValidUtf8(coll);

    if (!valid || db.empty())
        throw CCommandError(CErrorCode::InvalidNamespace,
                            CErrorMessages::invalidCollectionName(db, coll));
}

CCollectionOptions
CCollectionManager::parseCollectionOptions(const CDocument& command)
{
    CCollectionOptions options;
    const CValue* capped = command.get("capped");
    const CValue* size = command.get("size");
    const CValue* max = command.get("max");

    if (capped && !capped->isNull())
    {
        if (!capped->is<bool>())
        {
            if (!capped->isNumber())
                throw CCommandError(
                    CErrorCode::TypeMismatch,
                    CErrorMessages::wrongType("create.capped", *capped,
                                              "bool"));
            options.capped = capped->toDouble() != 0.0;
        }
        else
            options.capped = capped->as<bool>();
    }

    if (!options.capped)
        return options;

    if (!size || size->isNull())
        throw CCommandError(CErrorCode::InvalidOptions,
                            CErrorMessages::cappedSizeRequired());
    options.size = positiveSizeOption("size", *size);

    if (max && !max->isNull())
    {
        if (!max->isNumber())
            throw CCommandError(
                CErrorCode::TypeMismatch,
                CErrorMessages::wrongTypeNumeric("create.max", *max));
        double d = max->toDouble();

        if (max->is<int64_t>())
            options.max = std::max<int64_t>(0, max->as<int64_t>());
        else if (!std::isnan(d) && d > 0)
            options.max = d >= 9223372036854775807.0
                              ? std::numeric_limits<int64_t>::max()
                              : static_cast<int64_t>(d);
    }

    return options;
}

shared_ptr<CNamespaceLock>
CCollectionManager::namespaceLock(const string& db, const string& coll)
{
    std::lock_guard<std::mutex> guard(registryMutex_);
    string name = db + "." + coll;
    shared_ptr<CNamespaceLock> lock = namespaces_[name].lock();

    if (lock)
        return lock;

    /* Entries expire once no operation holds their lock */
    for (auto it = namespaces_.begin(); it != namespaces_.end();)
    {
        if (it->second.expired() && it->first != name)
            it = namespaces_.erase(it);
        else
            ++it;
    }

    lock = std::make_shared<CNamespaceLock>();
    namespaces_[name] = lock;
    return lock;
}

size_t
CCollectionManager::namespaceLockCount()
{
    std::lock_guard<std::mutex> guard(registryMutex_);

    return namespaces_.size();
}

/*
 * createLocked
 *		Caller holds the namespace catalog mutex. Absent -> Present happens
 *		exactly once; every other caller sees Present.
 */
bool
CCollectionManager::createLocked(const string& db, const string& coll,
                                 const CCollectionOptions& options)
{
    if (storage_->collectionExists(db, coll))
        return false;

    bool created = storage_->createCollection(db, coll, options);

    if (created)
        info_log(std::format("created collection {}.{}", db, coll));
    return created;
}

void
CCollectionManager::createCollection(const string& db, const string& coll,
                                     const CCollectionOptions& options)
{
    validateCollectionName(db, coll);

    auto ns = namespaceLock(db, coll);
    std::lock_guard<std::mutex> guard(ns->catalogMutex);

    if (!createLocked(db, coll, options) && config_.legacyNamespaceExists)
        throw CCommandError(CErrorCode::NamespaceExists,
                            CErrorMessages::collectionExists(db, coll));
}

bool
CCollectionManager::ensureCollection(const string& db, const string& coll)
{
    if (storage_->collectionExists(db, coll))
        return false;

    validateCollectionName(db, coll);

    auto ns = namespaceLock(db, coll);
    std::lock_guard<std::mutex> guard(ns->catalogMutex);

    return createLocked(db, coll, CCollectionOptions{});
}

bool
CCollectionManager::dropCollection(const string& db, const string& coll)
{
    auto ns = namespaceLock(db, coll);
    std::lock_guard<std::mutex> guard(ns->catalogMutex);

    bool dropped = storage_->dropCollection(db, coll);

    if (dropped)
        info_log(std::format("dropped collection {}.{}", db, coll));
    return dropped;
}

vector<CCollectionInfo>
CCollectionManager::listCollections(const string& db) const
{
    return storage_->listCollections(db);
}

vector<CIndexInfo>
CCollectionManager::listIndexes(const string& db, const string& coll) const
{
    if (!storage_->collectionExists(db, coll))
        throw CCommandError(CErrorCode::NamespaceNotFound,
                            CErrorMessages::namespaceDoesNotExist(db, coll));
    return storage_->listIndexes(db, coll);
}

string
CCollectionManager::formatIndexKey(const CDocument& key)
{
    string out;

    for (const auto& field : key.fields())
    {
        if (!out.empty())
            out += ", ";
        out += field.key + ": " + formatValue(field.value);
    }
    return out;
}

/*
 * parseIndexKey
 *		Normalizes every direction to int32 1 or -1.
 */
CDocument
CCollectionManager::parseIndexKey(const CDocument& key)
{
    CDocument normalized;
    std::set<string> seen;

    for (const auto& field : key.fields())
    {
        if (!seen.insert(field.key).second)
            throw CCommandError(
                CErrorCode::BadValue,
                CErrorMessages::indexFieldRepeated(CValue(key), field.key));

        int64_t direction = 0;

        if (wholeNumber(field.value, direction) != CWholeNumberStatus::Ok)
            throw CCommandError(
                CErrorCode::IndexNotFound,
                CErrorMessages::indexKeyNotFound(field.key, field.value));

        if (direction != 1 && direction != -1)
            throw CCommandError(
                CErrorCode::NotImplemented,
                CErrorMessages::indexDirectionNotImplemented(
                    CValue(direction)));

        normalized.append(field.key, static_cast<int32_t>(direction));
    }
    return normalized;
}

CIndexInfo
CCollectionManager::parseIndexSpec(const CDocument& spec)
{
    CIndexInfo index;

    if (spec.empty())
        throw CCommandError(CErrorCode::FailedToParse,
                            CErrorMessages::indexKeyMissing());

    const CValue* key = spec.get("key");

    if (!key || !key->isDocument())
        throw CCommandError(CErrorCode::TypeMismatch,
                            CErrorMessages::indexKeyNotObject());

    const CDocument& keyDoc = key->as<CDocument>();

    if (keyDoc.empty())
        throw CCommandError(CErrorCode::CannotCreateIndex,
                            CErrorMessages::indexKeyEmpty());

    if (keyDoc.size() == 1 && keyDoc.firstKey() == "_id")
    {
        int64_t direction = 0;

        if (wholeNumber(*keyDoc.get("_id"), direction) ==
                CWholeNumberStatus::Ok &&
            direction == -1)
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::idIndexDescending());
    }

    index.key = parseIndexKey(keyDoc);

    const CValue* name = spec.get("name");

    if (!name)
        throw CCommandError(CErrorCode::FailedToParse,
                            CErrorMessages::indexNameMissing(*key));
    if (!name->isString())
        throw CCommandError(CErrorCode::TypeMismatch,
                            CErrorMessages::indexNameNotString());
    index.name = name->as<string>();

    for (const auto& option : spec.fields())
    {
        if (option.key == "key" || option.key == "name" ||
            option.key == "background" || option.key == "v" ||
            option.key == "ns")
            continue;

        if (option.key == "unique")
        {
            if (!option.value.is<bool>())
                throw CCommandError(CErrorCode::TypeMismatch,
                                    CErrorMessages::indexUniqueNotBool(
                                        *key, index.name, option.value));
            if (index.key.size() == 1 && index.key.firstKey() == "_id")
                throw CCommandError(
                    CErrorCode::InvalidIndexSpecificationOption,
                    CErrorMessages::idIndexUnique(*key, index.name));
            index.unique = option.value.as<bool>();
            continue;
        }

        if (unimplementedIndexOptions.count(option.key))
            throw CCommandError(
                CErrorCode::NotImplemented,
                CErrorMessages::indexOptionNotImplemented(option.key));

        throw CCommandError(CErrorCode::BadValue,
                            CErrorMessages::indexOptionUnknown(option.key));
    }

    return index;
}

vector<CIndexInfo>
CCollectionManager::parseIndexSpecs(const CArray& indexes)
{
    vector<CIndexInfo> result;

    if (indexes.empty())
        throw CCommandError(CErrorCode::BadValue, CErrorMessages::noIndexes());

    for (size_t i = 0; i < indexes.size(); i++)
    {
        const CValue& spec = indexes.at(i);

        if (!spec.isDocument())
            throw CCommandError(CErrorCode::TypeMismatch,
                                CErrorMessages::indexSpecNotObject(i, spec));
        result.push_back(parseIndexSpec(spec.as<CDocument>()));
    }
    return result;
}

/*
 * filterIndexes
 *		Checks requested indexes against each other and against the
 *		existing ones. Indexes identical to an existing one are dropped
 *		from the result; any other name or key collision is an error.
 */
vector<CIndexInfo>
CCollectionManager::filterIndexes(const vector<CIndexInfo>& existing,
                                  const vector<CIndexInfo>& requested)
{
    vector<CIndexInfo> toCreate;

    for (size_t i = 0; i < requested.size(); i++)
    {
        const CIndexInfo& index = requested[i];
        string key = formatIndexKey(index.key);
        bool identicalExists = false;

        if (index.name.empty())
            throw CCommandError(CErrorCode::CannotCreateIndex,
                                CErrorMessages::indexNameEmpty(key));

        if (index.name == idIndexName && key != "_id: 1")
            throw CCommandError(CErrorCode::BadValue,
                                CErrorMessages::idIndexNameReserved(key));

        for (size_t j = i; j-- > 0;)
        {
            const CIndexInfo& other = requested[j];
            string otherKey = formatIndexKey(other.key);

            if (other.name == index.name && otherKey == key)
                throw CCommandError(CErrorCode::IndexAlreadyExists,
                                    CErrorMessages::identicalIndex(other.name));
            if (other.name == index.name)
                throw CCommandError(CErrorCode::IndexKeySpecsConflict,
                                    CErrorMessages::indexNameConflict(
                                        key, index.name, otherKey,
                                        other.name));
            if (otherKey == key)
                throw CCommandError(
                    CErrorCode::IndexOptionsConflict,
                    CErrorMessages::indexKeyConflict(other.name));
        }

        for (const auto& current : existing)
        {
            string currentKey = formatIndexKey(current.key);

            if (current.name == index.name && currentKey == key)
            {
                identicalExists = true;
                break;
            }
            if (current.name == index.name)
                throw CCommandError(CErrorCode::IndexKeySpecsConflict,
                                    CErrorMessages::indexNameConflict(
                                        key, index.name, currentKey,
                                        current.name));
            if (currentKey == key)
                throw CCommandError(
                    CErrorCode::IndexOptionsConflict,
                    CErrorMessages::indexKeyConflict(current.name));
        }

        if (!identicalExists)
            toCreate.push_back(index);
    }

    return toCreate;
}

CCreateIndexesResult
CCollectionManager::createIndexes(const string& db, const string& coll,
                                  const CValue* indexes)
{
    CCreateIndexesResult result;

    if (coll.empty())
        throw CCommandError(CErrorCode::InvalidNamespace,
                            CErrorMessages::invalidNamespace(db, coll));

    if (!indexes)
        throw CCommandError(
            CErrorCode::MissingField,
            CErrorMessages::missingField("createIndexes.indexes"));
    if (indexes->isNull())
        throw CCommandError(CErrorCode::Location10065,
                            CErrorMessages::indexesNull());
    if (!indexes->isArray())
        throw CCommandError(CErrorCode::TypeMismatch,
                            CErrorMessages::wrongType("createIndexes.indexes",
                                                      *indexes, "array"));

    vector<CIndexInfo> requested = parseIndexSpecs(indexes->as<CArray>());

    try
    {
        validateCollectionName(db, coll);
    }
    catch (const CCommandError&)
    {
        throw CCommandError(CErrorCode::InvalidNamespace,
                            CErrorMessages::invalidNamespace(db, coll));
    }

    auto ns = namespaceLock(db, coll);
    std::lock_guard<std::mutex> guard(ns->catalogMutex);

    bool exists = storage_->collectionExists(db, coll);
    vector<CIndexInfo> existing;

    if (exists)
        existing = storage_->listIndexes(db, coll);

    result.numIndexesBefore =
        std::max<int32_t>(1, static_cast<int32_t>(existing.size()));

    vector<CIndexInfo> toCreate = filterIndexes(existing, requested);

    if (toCreate.empty())
    {
        result.numIndexesAfter = result.numIndexesBefore;
        result.allExisted = true;
        return result;
    }

    result.createdCollectionAutomatically =
        createLocked(db, coll, CCollectionOptions{});

    vector<string> created;

    try
    {
        for (const auto& index : toCreate)
        {
            if (storage_->createIndex(db, coll, index))
            {
                created.push_back(index.name);
                info_log(std::format("created index {} on {}.{}", index.name,
                                     db, coll));
            }
        }
    }
    catch (const CCommandError& e)
    {
        /* The command either builds every index or leaves no trace */
        if (result.createdCollectionAutomatically)
            storage_->dropCollection(db, coll);
        else
        {
            for (const auto& name : created)
                storage_->dropIndex(db, coll, name);
        }
        warn_log(std::format("createIndexes on {}.{} rolled back: {}", db,
                             coll, e.what()));
        throw;
    }

    result.numIndexesAfter =
        static_cast<int32_t>(storage_->listIndexes(db, coll).size());
    return result;
}

/*
 * resolveDropKey
 *		Name of the index whose key is exactly key, after the same key
 *		validation createIndexes applies.
 */
string
CCollectionManager::resolveDropKey(const CDocument& key,
                                   const vector<CIndexInfo>& existing) const
{
    CDocument normalized = parseIndexKey(key);
    string formatted = formatIndexKey(normalized);

    if (isIdIndexKey(normalized))
        throw CCommandError(CErrorCode::InvalidOptions,
                            CErrorMessages::cannotDropIdIndex());

    for (const auto& index : existing)
    {
        if (formatIndexKey(index.key) == formatted)
            return index.name;
    }

    throw CCommandError(CErrorCode::IndexNotFound,
                        CErrorMessages::indexNotFoundWithKey(formatted));
}

vector<string>
CCollectionManager::resolveDropSelector(const CValue& selector,
                                        const vector<CIndexInfo>& existing,
                                        bool& dropAll) const
{
    vector<string> toDrop;

    dropAll = false;

    auto byName = [&existing](const string& name) {
        if (name == idIndexName)
            throw CCommandError(CErrorCode::InvalidOptions,
                                CErrorMessages::cannotDropIdIndex());

        for (const auto& index : existing)
        {
            if (index.name == name)
                return name;
        }
        throw CCommandError(CErrorCode::IndexNotFound,
                            CErrorMessages::indexNotFoundWithName(name));
    };

    if (selector.isDocument())
    {
        toDrop.push_back(resolveDropKey(selector.as<CDocument>(), existing));
        return toDrop;
    }

    if (selector.isArray())
    {
        for (const auto& element : selector.as<CArray>().values())
        {
            if (element.isString())
                toDrop.push_back(byName(element.as<string>()));
            else if (element.isDocument())
                toDrop.push_back(
                    resolveDropKey(element.as<CDocument>(), existing));
            else
                throw CCommandError(
                    CErrorCode::TypeMismatch,
                    CErrorMessages::dropIndexWrongType(selector));
        }
        return toDrop;
    }

    if (selector.isString())
    {
        const string& name = selector.as<string>();

        if (name == "*")
        {
            for (const auto& index : existing)
            {
                if (index.name != idIndexName)
                    toDrop.push_back(index.name);
            }
            dropAll = true;
            return toDrop;
        }

        toDrop.push_back(byName(name));
        return toDrop;
    }

    throw CCommandError(CErrorCode::TypeMismatch,
                        CErrorMessages::dropIndexWrongType(selector));
}

CDropIndexesResult
CCollectionManager::dropIndexes(const string& db, const string& coll,
                                const CValue* selector)
{
    CDropIndexesResult result;

    if (!selector)
        throw CCommandError(CErrorCode::MissingField,
                            CErrorMessages::missingField("dropIndexes.index"));

    auto ns = namespaceLock(db, coll);
    std::lock_guard<std::mutex> guard(ns->catalogMutex);

    if (!storage_->collectionExists(db, coll))
        throw CCommandError(CErrorCode::NamespaceNotFound,
                            CErrorMessages::namespaceNotFound(db, coll));

    vector<CIndexInfo> existing = storage_->listIndexes(db, coll);
    vector<string> toDrop =
        resolveDropSelector(*selector, existing, result.droppedAll);

    result.nIndexesWas = static_cast<int32_t>(existing.size());

    for (const auto& name : toDrop)
    {
        if (storage_->dropIndex(db, coll, name))
            info_log(std::format("dropped index {} on {}.{}", name, db, coll));
    }
    return result;
}

} // namespace StrataDB
