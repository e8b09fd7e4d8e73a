/*-------------------------------------------------------------------------
 *
 * CMemoryStorage.cpp
 *      In-process storage backend.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "storage/CMemoryStorage.hpp"

#include "document/CPath.hpp"
#include "document/CValueCompare.hpp"
#include "errors/CCommandError.hpp"
#include "errors/CErrorMessages.hpp"
#include "protocol/CBsonCodec.hpp"

#include <mutex>

namespace StrataDB
{

namespace
{

const string kIdIndexName = "_id_";

vector<CValue>
indexKeyValues(const CIndexInfo& index, const CDocument& doc)
{
    vector<CValue> values;

    for (const auto& field : index.key.fields())
    {
        const CValue* value = CPath::get(doc, field.key);

        values.push_back(value ? *value : CValue());
    }
    return values;
}

bool
sameKey(const vector<CValue>& a, const vector<CValue>& b)
{
    for (size_t i = 0; i < a.size(); i++)
    {
        if (!valuesEqual(a[i], b[i]))
            return false;
    }
    return true;
}

int64_t
indexEntrySize(const CIndexInfo& index, const CDocument& doc)
{
    CDocument entry;
    vector<CValue> values = indexKeyValues(index, doc);

    for (size_t i = 0; i < values.size(); i++)
        entry.append(index.key.fields()[i].key, values[i]);
    return static_cast<int64_t>(CBsonCodec::encodedSize(entry));
}

} // namespace

CMemoryStorage::CMemoryStorage()
{
}

CMemoryStorage::~CMemoryStorage()
{
}

CMemoryStorage::CCollectionData*
CMemoryStorage::find(const string& db, const string& coll)
{
    auto dbIt = databases_.find(db);

    if (dbIt == databases_.end())
        return nullptr;

    auto it = dbIt->second.find(coll);

    return it == dbIt->second.end() ? nullptr : &it->second;
}

const CMemoryStorage::CCollectionData*
CMemoryStorage::find(const string& db, const string& coll) const
{
    auto dbIt = databases_.find(db);

    if (dbIt == databases_.end())
        return nullptr;

    auto it = dbIt->second.find(coll);

    return it == dbIt->second.end() ? nullptr : &it->second;
}

bool
CMemoryStorage::createCollection(const string& db, const string& coll,
                                 const CCollectionOptions& options)
{
    std::unique_lock lock(mutex_);
    auto& collections = databases_[db];

    if (collections.count(coll))
        return false;

    CCollectionData& data = collections[coll];

    data.options = options;
    data.indexes.push_back(
        CIndexInfo{kIdIndexName, CDocument{{"_id", CValue(int32_t{1})}},
                   true});
    return true;
}

bool
CMemoryStorage::dropCollection(const string& db, const string& coll)
{
    std::unique_lock lock(mutex_);
    auto dbIt = databases_.find(db);

    if (dbIt == databases_.end() || !dbIt->second.erase(coll))
        return false;
    if (dbIt->second.empty())
        databases_.erase(dbIt);
    return true;
}

bool
CMemoryStorage::collectionExists(const string& db, const string& coll) const
{
    std::shared_lock lock(mutex_);

    return find(db, coll) != nullptr;
}

vector<CCollectionInfo>
CMemoryStorage::listCollections(const string& db) const
{
    std::shared_lock lock(mutex_);
    vector<CCollectionInfo> result;
    auto dbIt = databases_.find(db);

    if (dbIt == databases_.end())
        return result;
    for (const auto& [name, data] : dbIt->second)
        result.push_back(CCollectionInfo{name, data.options});
    return result;
}

/*
 * checkUnique
 *		Raise DuplicateKey if doc collides with a stored record (other than
 *		skipRecordId) or with a document earlier in the same batch on any
 *		unique index.
 */
void
CMemoryStorage::checkUnique(const string& db, const string& coll,
                            const CCollectionData& data, const CDocument& doc,
                            int64_t skipRecordId,
                            const vector<CDocument>& pending) const
{
    for (const auto& index : data.indexes)
    {
        if (!index.unique)
            continue;

        vector<CValue> key = indexKeyValues(index, doc);

        for (const auto& [recordId, stored] : data.records)
        {
            if (recordId != skipRecordId &&
                sameKey(key, indexKeyValues(index, stored)))
                throw CCommandError(CErrorCode::DuplicateKey,
                                    CErrorMessages::duplicateKeyError(db,
                                                                      coll));
        }
        for (const auto& other : pending)
        {
            if (sameKey(key, indexKeyValues(index, other)))
                throw CCommandError(CErrorCode::DuplicateKey,
                                    CErrorMessages::duplicateKeyError(db,
                                                                      coll));
        }
    }
}

/* Evict the oldest records of a capped collection until it fits */
void
CMemoryStorage::enforceCap(CCollectionData& data)
{
    if (!data.options.capped)
        return;

    auto over = [&data]()
    {
        if (data.options.max > 0 &&
            static_cast<int64_t>(data.records.size()) > data.options.max)
            return true;
        return data.options.size > 0 && data.dataSize > data.options.size;
    };

    while (data.records.size() > 1 && over())
    {
        auto oldest = data.records.begin();

        data.dataSize -= data.sizes[oldest->first];
        data.sizes.erase(oldest->first);
        data.records.erase(oldest);
    }
}

void
CMemoryStorage::insertDocuments(const string& db, const string& coll,
                                const vector<CDocument>& docs)
{
    std::unique_lock lock(mutex_);
    CCollectionData* data = find(db, coll);
    vector<CDocument> pending;

    if (!data)
        throw CCommandError(CErrorCode::NamespaceNotFound,
                            CErrorMessages::namespaceNotFound(db, coll));

    for (const auto& doc : docs)
    {
        checkUnique(db, coll, *data, doc, 0, pending);
        pending.push_back(doc);
    }

    for (auto& doc : pending)
    {
        int64_t recordId = data->nextRecordId++;
        auto size = static_cast<int64_t>(CBsonCodec::encodedSize(doc));

        data->sizes[recordId] = size;
        data->dataSize += size;
        data->records.emplace(recordId, std::move(doc));
    }
    enforceCap(*data);
}

vector<CRecord>
CMemoryStorage::read(const string& db, const string& coll,
                     int64_t afterRecordId, size_t batchSize) const
{
    std::shared_lock lock(mutex_);
    vector<CRecord> batch;
    const CCollectionData* data = find(db, coll);

    if (!data)
        return batch;

    for (auto it = data->records.upper_bound(afterRecordId);
         it != data->records.end() && batch.size() < batchSize; ++it)
        batch.push_back(CRecord{it->first, it->second});
    return batch;
}

bool
CMemoryStorage::replaceDocument(const string& db, const string& coll,
                                int64_t recordId, const CDocument& doc)
{
    std::unique_lock lock(mutex_);
    CCollectionData* data = find(db, coll);

    if (!data)
        return false;

    auto it = data->records.find(recordId);

    if (it == data->records.end())
        return false;

    checkUnique(db, coll, *data, doc, recordId, {});

    auto size = static_cast<int64_t>(CBsonCodec::encodedSize(doc));

    data->dataSize += size - data->sizes[recordId];
    data->sizes[recordId] = size;
    it->second = doc;
    return true;
}

size_t
CMemoryStorage::deleteDocuments(const string& db, const string& coll,
                                const vector<int64_t>& recordIds)
{
    std::unique_lock lock(mutex_);
    CCollectionData* data = find(db, coll);
    size_t deleted = 0;

    if (!data)
        return 0;

    for (int64_t recordId : recordIds)
    {
        if (data->records.erase(recordId))
        {
            data->dataSize -= data->sizes[recordId];
            data->sizes.erase(recordId);
            deleted++;
        }
    }
    return deleted;
}

bool
CMemoryStorage::createIndex(const string& db, const string& coll,
                            const CIndexInfo& index)
{
    std::unique_lock lock(mutex_);
    CCollectionData* data = find(db, coll);

    if (!data)
        return false;
    for (const auto& existing : data->indexes)
    {
        if (existing.name == index.name)
            return false;
    }

    if (index.unique)
    {
        vector<vector<CValue>> seen;

        for (const auto& [recordId, doc] : data->records)
        {
            vector<CValue> key = indexKeyValues(index, doc);

            for (const auto& other : seen)
            {
                if (sameKey(key, other))
                    throw CCommandError(
                        CErrorCode::DuplicateKey,
                        CErrorMessages::duplicateKeyError(db, coll));
            }
            seen.push_back(std::move(key));
        }
    }

    data->indexes.push_back(index);
    return true;
}

bool
CMemoryStorage::dropIndex(const string& db, const string& coll,
                          const string& name)
{
    std::unique_lock lock(mutex_);
    CCollectionData* data = find(db, coll);

    if (!data || name == kIdIndexName)
        return false;

    for (auto it = data->indexes.begin(); it != data->indexes.end(); ++it)
    {
        if (it->name == name)
        {
            data->indexes.erase(it);
            return true;
        }
    }
    return false;
}

vector<CIndexInfo>
CMemoryStorage::listIndexes(const string& db, const string& coll) const
{
    std::shared_lock lock(mutex_);
    const CCollectionData* data = find(db, coll);

    return data ? data->indexes : vector<CIndexInfo>{};
}

CCollectionStats
CMemoryStorage::collectionStats(const string& db, const string& coll) const
{
    std::shared_lock lock(mutex_);
    CCollectionStats stats;
    const CCollectionData* data = find(db, coll);

    if (!data)
        return stats;

    stats.count = static_cast<int64_t>(data->records.size());
    stats.dataSize = data->dataSize;
    for (const auto& index : data->indexes)
    {
        int64_t size = 0;

        for (const auto& [recordId, doc] : data->records)
            size += indexEntrySize(index, doc);
        stats.indexSizes.emplace_back(index.name, size);
        stats.indexSize += size;
    }
    return stats;
}

} // namespace StrataDB
