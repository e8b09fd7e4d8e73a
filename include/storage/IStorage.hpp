/*-------------------------------------------------------------------------
 *
 * IStorage.hpp
 *      Storage backend interface for StrataDB.
 *
 *      Everything the core needs from physical storage goes through this
 *      interface. Implementations must be safe to call from several
 *      worker threads at once.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CValue.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace StrataDB
{

/* Options a collection was created with */
struct CCollectionOptions
{
    bool capped = false;
    int64_t size = 0;
    int64_t max = 0;
};

struct CCollectionInfo
{
    string name;
    CCollectionOptions options;
};

/*
 * CIndexInfo
 *		key holds the { field: 1 | -1, ... } specification in order.
 */
struct CIndexInfo
{
    string name;
    CDocument key;
    bool unique = false;
};

/* A stored document and its position in the collection */
struct CRecord
{
    int64_t recordId = 0;
    CDocument document;
};

struct CCollectionStats
{
    int64_t count = 0;
    int64_t dataSize = 0;
    int64_t indexSize = 0;
    vector<std::pair<string, int64_t>> indexSizes;
};

class IStorage
{
  public:
    virtual ~IStorage() = default;

    /*
     * Create the collection and its _id_ index unless it already exists.
     * Returns true only for the caller that actually created it.
     */
    virtual bool createCollection(const string& db, const string& coll,
                                  const CCollectionOptions& options) = 0;
    virtual bool dropCollection(const string& db, const string& coll) = 0;
    virtual bool collectionExists(const string& db,
                                  const string& coll) const = 0;
    virtual vector<CCollectionInfo> listCollections(const string& db) const = 0;

    /* All or nothing; raises DuplicateKey on a unique index violation */
    virtual void insertDocuments(const string& db, const string& coll,
                                 const vector<CDocument>& docs) = 0;

    /*
     * Up to batchSize records with a record id greater than afterRecordId,
     * in insertion order. An empty result ends the scan.
     */
    virtual vector<CRecord> read(const string& db, const string& coll,
                                 int64_t afterRecordId,
                                 size_t batchSize) const = 0;

    virtual bool replaceDocument(const string& db, const string& coll,
                                 int64_t recordId, const CDocument& doc) = 0;
    virtual size_t deleteDocuments(const string& db, const string& coll,
                                   const vector<int64_t>& recordIds) = 0;

    virtual bool createIndex(const string& db, const string& coll,
                             const CIndexInfo& index) = 0;
    virtual bool dropIndex(const string& db, const string& coll,
                           const string& name) = 0;
    virtual vector<CIndexInfo> listIndexes(const string& db,
                                           const string& coll) const = 0;

    virtual CCollectionStats collectionStats(const string& db,
                                             const string& coll) const = 0;
};

} // namespace StrataDB
