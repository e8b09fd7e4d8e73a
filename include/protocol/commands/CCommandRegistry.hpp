/*-------------------------------------------------------------------------
 *
 * CCommandRegistry.hpp
 *      Registry for managing document database commands
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "IDocumentCommand.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace StrataDB
{

using std::string;
using std::unique_ptr;
using std::unordered_map;
using std::vector;

class CCommandRegistry
{
  public:
    CCommandRegistry();
    ~CCommandRegistry();

    /* Command registration */
    void registerCommand(unique_ptr<IDocumentCommand> command);
    void unregisterCommand(const string& commandName);

    /* Command lookup; nullptr when the name is unknown */
    bool hasCommand(const string& commandName) const;
    IDocumentCommand* findCommand(const string& commandName) const;

    /* Registry information */
    vector<string> getRegisteredCommands() const;
    size_t getCommandCount() const;

  private:
    unordered_map<string, unique_ptr<IDocumentCommand>> commands_;

    void initializeBuiltinCommands();
};

} // namespace StrataDB
