/*-------------------------------------------------------------------------
 *
 * CMemoryStorage.hpp
 *      In-process storage backend.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "storage/IStorage.hpp"

#include <map>
#include <shared_mutex>

namespace StrataDB
{

class CMemoryStorage : public IStorage
{
  public:
    CMemoryStorage();
    ~CMemoryStorage() override;

    bool createCollection(const string& db, const string& coll,
                          const CCollectionOptions& options) override;
    bool dropCollection(const string& db, const string& coll) override;
    bool collectionExists(const string& db,
                          const string& coll) const override;
    vector<CCollectionInfo> listCollections(const string& db) const override;

    void insertDocuments(const string& db, const string& coll,
                         const vector<CDocument>& docs) override;
    vector<CRecord> read(const string& db, const string& coll,
                         int64_t afterRecordId,
                         size_t batchSize) const override;
    bool replaceDocument(const string& db, const string& coll,
                         int64_t recordId, const CDocument& doc) override;
    size_t deleteDocuments(const string& db, const string& coll,
                           const vector<int64_t>& recordIds) override;

    bool createIndex(const string& db, const string& coll,
                     const CIndexInfo& index) override;
    bool dropIndex(const string& db, const string& coll,
                   const string& name) override;
    vector<CIndexInfo> listIndexes(const string& db,
                                   const string& coll) const override;

    CCollectionStats collectionStats(const string& db,
                                     const string& coll) const override;

  private:
    struct CCollectionData
    {
        CCollectionOptions options;
        std::map<int64_t, CDocument> records;
        std::map<int64_t, int64_t> sizes;
        vector<CIndexInfo> indexes;
        int64_t nextRecordId = 1;
        int64_t dataSize = 0;
    };

    CCollectionData* find(const string& db, const string& coll);
    const CCollectionData* find(const string& db, const string& coll) const;

    void checkUnique(const string& db, const string& coll,
                     const CCollectionData& data, const CDocument& doc,
                     int64_t skipRecordId,
                     const vector<CDocument>& pending) const;
    void enforceCap(CCollectionData& data);

    mutable std::shared_mutex mutex_;
    std::map<string, std::map<string, CCollectionData>> databases_;
};

} // namespace StrataDB
