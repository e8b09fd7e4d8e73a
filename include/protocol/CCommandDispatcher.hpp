/*-------------------------------------------------------------------------
 *
 * CCommandDispatcher.hpp
 *      Routes decoded command documents to their handlers.
 *
 *      The dispatcher owns the collection manager, the command registry
 *      and the worker pool. Every call produces exactly one reply
 *      document: either the handler's reply or
 *      { ok: 0.0, code, codeName, errmsg }.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CServerConfig.hpp"
#include "IInterfaces.hpp"
#include "catalog/CCollectionManager.hpp"
#include "commands/CCommandRegistry.hpp"
#include "errors/CCommandError.hpp"
#include "runtime/CCancellationToken.hpp"
#include "runtime/CWorkerPool.hpp"
#include "storage/IStorage.hpp"

#include <future>
#include <memory>
#include <string>

namespace StrataDB
{

class CCommandDispatcher
{
  public:
    CCommandDispatcher(shared_ptr<IStorage> storage,
                       const CServerConfig& config);
    ~CCommandDispatcher();

    CCommandDispatcher(const CCommandDispatcher&) = delete;
    CCommandDispatcher& operator=(const CCommandDispatcher&) = delete;

    void setLogger(shared_ptr<ILogger> logger);

    /*
     * Run a command on the calling thread. A "$db" field in the command
     * overrides database.
     */
    CDocument dispatch(const string& database, const CDocument& command,
                       const CCancellationToken& token = CCancellationToken());

    /* Run a command on the worker pool */
    std::future<CDocument>
    submit(const string& database, const CDocument& command,
           const CCancellationToken& token = CCancellationToken());

    static CDocument errorReply(const CCommandError& error);

    CCollectionManager& manager() noexcept
    {
        return manager_;
    }

    const CCommandRegistry& registry() const noexcept
    {
        return registry_;
    }

  private:
    CDocument execute(const string& database, const CDocument& command,
                      const CCancellationToken& token);

    CServerConfig config_;
    CCollectionManager manager_;
    CCommandRegistry registry_;
    std::unique_ptr<CWorkerPool> pool_;
    shared_ptr<ILogger> logger_;
};

} // namespace StrataDB
