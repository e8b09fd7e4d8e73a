/*-------------------------------------------------------------------------
 *
 * CServerConfig.hpp
 *      Typed server settings for StrataDB.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

namespace StrataDB
{

class CConfig;

struct CServerConfig
{
    std::string serverName;
    std::string logLevel;
    std::string logFile;
    std::string configFile;
    size_t workerThreads;

    /* Documents fetched from storage per scan step */
    size_t scanBatchSize;

    /* Duplicate create answers NamespaceExists instead of succeeding */
    bool legacyNamespaceExists;

    size_t maxDocumentSize;

    CServerConfig()
        : serverName("StrataDB"), logLevel("INFO"), logFile(""),
          configFile(""), workerThreads(4), scanBatchSize(101),
          legacyNamespaceExists(false), maxDocumentSize(16 * 1024 * 1024)
    {
    }

    void setDefaults();
    std::error_code loadFromFile(const std::string& filename);
    void loadFromConfig(const CConfig& config);
    bool validate() const;
};

} /* namespace StrataDB */
