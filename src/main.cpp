/*-------------------------------------------------------------------------
 *
 * main.cpp
 *		  Main entry point for the StrataDB shell
 *
 * Reads one extended JSON command per line from standard input, runs it
 * against an in-process database and prints the reply.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/main.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CLogger.hpp"
#include "CServerConfig.hpp"
#include "protocol/CBsonCodec.hpp"
#include "protocol/CCommandDispatcher.hpp"
#include "storage/CMemoryStorage.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace StrataDB;

static void
print_usage(const char *progname)
{
	std::cout << "StrataDB - Document Database Shell\n";
	std::cout << "Usage: " << progname << " [OPTIONS]\n\n";
	std::cout << "Options:\n";
	std::cout << "  -c, --config <file>    Configuration file "
				 "(supports .json, .yaml, .yml)\n";
	std::cout << "  -d, --database <name>  Database commands run against "
				 "(default: test)\n";
	std::cout << "  -h, --help             Show this help message\n";
	std::cout << "  -v, --version          Show version information\n\n";
	std::cout << "Commands are read from standard input, one extended JSON "
				 "document per line.\n";
}

int
main(int argc, char **argv)
{
	std::string					configFile;
	std::string					database = "test";
	std::string					arg;
	std::string					line;
	CServerConfig				config;
	std::error_code				err;
	std::shared_ptr<CLogger>	loggerPtr;

	for (int i = 1; i < argc; ++i)
	{
		arg = argv[i];

		if (arg == "-h" || arg == "--help")
		{
			print_usage(argv[0]);
			return 0;
		}
		else if (arg == "-v" || arg == "--version")
		{
			std::cout << "StrataDB version 1.0.0\n";
			return 0;
		}
		else if ((arg == "-c" || arg == "--config") && i + 1 < argc)
		{
			configFile = argv[i + 1];
			++i;
		}
		else if ((arg == "-d" || arg == "--database") && i + 1 < argc)
		{
			database = argv[i + 1];
			++i;
		}
		else
		{
			std::cerr << "Unknown option: " << arg << std::endl;
			std::cerr << "Use --help for usage information.\n";
			return 1;
		}
	}

	try
	{
		if (!configFile.empty())
		{
			err = config.loadFromFile(configFile);
			if (err)
			{
				std::cerr << "Failed to load config file: " << configFile
						  << ", error=" << err.message() << std::endl;
				return 1;
			}
		}
		else
		{
			config.setDefaults();
		}

		if (!config.validate())
		{
			std::cerr << "Invalid configuration" << std::endl;
			return 1;
		}

		loggerPtr = std::make_shared<CLogger>(config);
		loggerPtr->setLogLevel(CLogger::parseLevel(config.logLevel));
		if (!config.logFile.empty())
			loggerPtr->setLogFile(config.logFile);
		err = loggerPtr->initialize();
		if (err)
		{
			std::cerr << "Failed to open log file: " << config.logFile
					  << ", error=" << err.message() << std::endl;
			return 1;
		}

		CCommandDispatcher dispatcher(std::make_shared<CMemoryStorage>(),
									  config);

		dispatcher.setLogger(loggerPtr);
		loggerPtr->log(CLogLevel::INFO,
					   config.serverName + " shell ready on database " +
					   database);

		while (std::getline(std::cin, line))
		{
			CDocument	reply;

			if (line.find_first_not_of(" \t\r") == std::string::npos)
				continue;

			try
			{
				reply = dispatcher.dispatch(database,
											CBsonCodec::fromJson(line));
			}
			catch (const CCommandError& e)
			{
				reply = CCommandDispatcher::errorReply(e);
			}

			std::cout << CBsonCodec::toJson(reply) << std::endl;
		}

		loggerPtr->log(CLogLevel::INFO, "StrataDB shell shutdown complete");
		loggerPtr->shutdown();
		return 0;
	}
	catch (const std::exception& e)
	{
		std::cerr << "Fatal error: " << e.what() << std::endl;
		return 1;
	}
}
