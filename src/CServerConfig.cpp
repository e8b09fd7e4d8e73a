/*-------------------------------------------------------------------------
 *
 * CServerConfig.cpp
 *		  Server configuration implementation for StrataDB
 *
 * Handles server configuration loading, validation, and default values.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/CServerConfig.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CServerConfig.hpp"

#include "CConfig.hpp"

namespace StrataDB
{

/*
 * setDefaults
 *		Set default configuration values
 */
void
CServerConfig::setDefaults()
{
	serverName = "StrataDB";
	logLevel = "INFO";
	logFile = "";
	workerThreads = 4;
	scanBatchSize = 101;
	legacyNamespaceExists = false;
	maxDocumentSize = 16 * 1024 * 1024;
}

/*
 * loadFromFile
 *		Load configuration from a JSON or YAML file
 */
std::error_code
CServerConfig::loadFromFile(const std::string& filename)
{
	CConfig config;
	std::error_code ec = config.loadFromFile(filename);

	if (ec)
		return ec;

	configFile = filename;
	loadFromConfig(config);
	if (!validate())
		return std::make_error_code(std::errc::invalid_argument);
	return std::error_code{};
}

/*
 * loadFromConfig
 *		Copy recognised keys out of a flattened configuration store,
 *		keeping current values for anything absent
 */
void
CServerConfig::loadFromConfig(const CConfig& config)
{
	serverName = config.getString("server.name", serverName);
	logLevel = config.getString("logging.level", logLevel);
	logFile = config.getString("logging.file", logFile);
	workerThreads = static_cast<size_t>(
		config.getInt64("server.workerThreads",
						static_cast<int64_t>(workerThreads)));
	scanBatchSize = static_cast<size_t>(
		config.getInt64("storage.scanBatchSize",
						static_cast<int64_t>(scanBatchSize)));
	legacyNamespaceExists = config.getBool("compat.legacyNamespaceExists",
										   legacyNamespaceExists);
	maxDocumentSize = static_cast<size_t>(
		config.getInt64("storage.maxDocumentSize",
						static_cast<int64_t>(maxDocumentSize)));
}

/*
 * validate
 *		Validate configuration values
 */
bool
CServerConfig::validate() const
{
	if (workerThreads == 0)
		return false;
	if (scanBatchSize == 0)
		return false;
	if (maxDocumentSize == 0)
		return false;
	return true;
}

} /* namespace StrataDB */
