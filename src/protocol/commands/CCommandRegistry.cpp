/*-------------------------------------------------------------------------
 *
 * CCommandRegistry.cpp
 *      Registry implementation for managing document database commands
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "commands/CCommandRegistry.hpp"

#include "commands/CCollStatsCommand.hpp"
#include "commands/CCountCommand.hpp"
#include "commands/CCreateCommand.hpp"
#include "commands/CCreateIndexesCommand.hpp"
#include "commands/CDataSizeCommand.hpp"
#include "commands/CDbStatsCommand.hpp"
#include "commands/CDeleteCommand.hpp"
#include "commands/CDropCommand.hpp"
#include "commands/CDropIndexesCommand.hpp"
#include "commands/CExplainCommand.hpp"
#include "commands/CFindAndModifyCommand.hpp"
#include "commands/CFindCommand.hpp"
#include "commands/CInsertCommand.hpp"
#include "commands/CListCollectionsCommand.hpp"
#include "commands/CListIndexesCommand.hpp"
#include "commands/CPingCommand.hpp"
#include "commands/CUpdateCommand.hpp"

#include <algorithm>

namespace StrataDB
{

CCommandRegistry::CCommandRegistry()
{
    initializeBuiltinCommands();
}

CCommandRegistry::~CCommandRegistry()
{
    /* Unique pointers will clean up automatically */
}

void
CCommandRegistry::registerCommand(unique_ptr<IDocumentCommand> command)
{
    if (command)
    {
        string commandName = command->getCommandName();
        commands_[commandName] = std::move(command);
    }
}

void
CCommandRegistry::unregisterCommand(const string& commandName)
{
    commands_.erase(commandName);
}

bool
CCommandRegistry::hasCommand(const string& commandName) const
{
    return commands_.find(commandName) != commands_.end();
}

IDocumentCommand*
CCommandRegistry::findCommand(const string& commandName) const
{
    auto it = commands_.find(commandName);

    return it == commands_.end() ? nullptr : it->second.get();
}

vector<string>
CCommandRegistry::getRegisteredCommands() const
{
    vector<string> commandNames;
    commandNames.reserve(commands_.size());

    for (const auto& pair : commands_)
        commandNames.push_back(pair.first);

    std::sort(commandNames.begin(), commandNames.end());
    return commandNames;
}

size_t
CCommandRegistry::getCommandCount() const
{
    return commands_.size();
}

void
CCommandRegistry::initializeBuiltinCommands()
{
    registerCommand(std::make_unique<CInsertCommand>());
    registerCommand(std::make_unique<CFindCommand>());
    registerCommand(std::make_unique<CCountCommand>());
    registerCommand(std::make_unique<CUpdateCommand>());
    registerCommand(std::make_unique<CDeleteCommand>());
    registerCommand(std::make_unique<CFindAndModifyCommand>());
    registerCommand(std::make_unique<CCreateCommand>());
    registerCommand(std::make_unique<CDropCommand>());
    registerCommand(std::make_unique<CListCollectionsCommand>());
    registerCommand(std::make_unique<CCreateIndexesCommand>());
    registerCommand(std::make_unique<CDropIndexesCommand>());
    registerCommand(std::make_unique<CListIndexesCommand>());
    registerCommand(std::make_unique<CCollStatsCommand>());
    registerCommand(std::make_unique<CDbStatsCommand>());
    registerCommand(std::make_unique<CDataSizeCommand>());
    registerCommand(std::make_unique<CPingCommand>());

    /* explain looks wrapped commands up in this registry */
    registerCommand(std::make_unique<CExplainCommand>(*this));
}

} // namespace StrataDB
