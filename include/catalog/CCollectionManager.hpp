/*-------------------------------------------------------------------------
 *
 * CCollectionManager.hpp
 *      Collection and index lifecycle for StrataDB.
 *
 *      All catalog changes for one namespace are serialized through that
 *      namespace's catalog mutex, so racing creators observe a single
 *      physical collection. Different namespaces never contend.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CServerConfig.hpp"
#include "IInterfaces.hpp"
#include "storage/IStorage.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace StrataDB
{

using std::shared_ptr;

/* Mutexes owned by one (database, collection) pair */
struct CNamespaceLock
{
    /* create, drop and index changes */
    std::mutex catalogMutex;
    /* read-modify-write of documents */
    std::mutex writeMutex;
};

struct CCreateIndexesResult
{
    int32_t numIndexesBefore = 0;
    int32_t numIndexesAfter = 0;
    bool createdCollectionAutomatically = false;
    /* Every requested index existed already */
    bool allExisted = false;
};

struct CDropIndexesResult
{
    int32_t nIndexesWas = 0;
    bool droppedAll = false;
};

class CCollectionManager
{
  public:
    CCollectionManager(shared_ptr<IStorage> storage,
                       const CServerConfig& config);

    void setLogger(shared_ptr<ILogger> logger);

    IStorage& storage() noexcept
    {
        return *storage_;
    }

    const CServerConfig& config() const noexcept
    {
        return config_;
    }

    /* Raises InvalidNamespace for names outside ^[^.$\0][^$\0]{0,234}$ */
    static void validateCollectionName(const string& db, const string& coll);

    /* capped/size/max from a create command; raises on invalid options */
    static CCollectionOptions parseCollectionOptions(const CDocument& command);

    /*
     * Explicit create. A second create for an existing name succeeds
     * unless the legacy NamespaceExists compatibility mode is enabled.
     */
    void createCollection(const string& db, const string& coll,
                          const CCollectionOptions& options);

    /* Implicit create on first write; true when this call created it */
    bool ensureCollection(const string& db, const string& coll);

    bool dropCollection(const string& db, const string& coll);

    vector<CCollectionInfo> listCollections(const string& db) const;

    CCreateIndexesResult createIndexes(const string& db, const string& coll,
                                       const CValue* indexes);

    CDropIndexesResult dropIndexes(const string& db, const string& coll,
                                   const CValue* selector);

    /* Raises NamespaceNotFound when the collection is absent */
    vector<CIndexInfo> listIndexes(const string& db, const string& coll) const;

    /*
     * Lock shared by every operation on db.coll while any of them holds
     * it. Registry entries nobody holds are pruned.
     */
    shared_ptr<CNamespaceLock> namespaceLock(const string& db,
                                             const string& coll);
    size_t namespaceLockCount();

    /* "f: 1, g: -1" */
    static string formatIndexKey(const CDocument& key);

    /* Parsed and validated index specifications, in request order */
    static vector<CIndexInfo> parseIndexSpecs(const CArray& indexes);

  private:
    static CIndexInfo parseIndexSpec(const CDocument& spec);
    static CDocument parseIndexKey(const CDocument& key);

    static vector<CIndexInfo> filterIndexes(const vector<CIndexInfo>& existing,
                                            const vector<CIndexInfo>& requested);

    vector<string> resolveDropSelector(const CValue& selector,
                                       const vector<CIndexInfo>& existing,
                                       bool& dropAll) const;
    string resolveDropKey(const CDocument& key,
                          const vector<CIndexInfo>& existing) const;

    bool createLocked(const string& db, const string& coll,
                      const CCollectionOptions& options);

    shared_ptr<IStorage> storage_;
    CServerConfig config_;
    shared_ptr<ILogger> logger_;

    std::mutex registryMutex_;
    std::map<string, std::weak_ptr<CNamespaceLock>> namespaces_;
};

} // namespace StrataDB
