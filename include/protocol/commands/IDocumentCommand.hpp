/*-------------------------------------------------------------------------
 *
 * IDocumentCommand.hpp
 *      Interface for document database command implementations
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CServerConfig.hpp"
#include "IInterfaces.hpp"
#include "catalog/CCollectionManager.hpp"
#include "document/CValue.hpp"
#include "runtime/CCancellationToken.hpp"

#include <memory>
#include <string>

namespace StrataDB
{

using std::shared_ptr;
using std::string;

/*
 * CommandContext
 *		Everything a command may touch while it runs. The manager and the
 *		configuration outlive every context that refers to them.
 */
struct CommandContext
{
    string databaseName;
    CDocument command;
    CCollectionManager* manager = nullptr;
    const CServerConfig* config = nullptr;
    CCancellationToken token;
    shared_ptr<ILogger> logger;
};

class IDocumentCommand
{
  public:
    virtual ~IDocumentCommand() = default;

    virtual string getCommandName() const = 0;

    /* Reply document including "ok"; failures are thrown as CCommandError */
    virtual CDocument execute(const CommandContext& context) = 0;

    /* Validate the command as execute() would, without side effects */
    virtual CDocument explain(const CommandContext& context) const = 0;
};

} // namespace StrataDB
