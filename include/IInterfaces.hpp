/*-------------------------------------------------------------------------
 *
 * IInterfaces.hpp
 *      Logging interface shared by every StrataDB component.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */
#pragma once
#include <string>
#include <system_error>

namespace StrataDB
{

/**
 * Log levels, least severe first
 */
enum class CLogLevel
{
	TRACE = 0,
	DEBUG = 1,
	INFO = 2,
	WARN = 3,
	ERROR = 4,
	FATAL = 5
};

/* Upper-case name used in log lines */
inline const char*
logLevelName(CLogLevel level)
{
	switch (level)
	{
	case CLogLevel::TRACE:
		return "TRACE";
	case CLogLevel::DEBUG:
		return "DEBUG";
	case CLogLevel::INFO:
		return "INFO";
	case CLogLevel::WARN:
		return "WARN";
	case CLogLevel::ERROR:
		return "ERROR";
	case CLogLevel::FATAL:
		return "FATAL";
	}
	return "UNKNOWN";
}

/**
 * Sink for component log messages. Components hold a shared_ptr that
 * may be null; the macros in CLogMacros.hpp skip logging then.
 */
class ILogger
{
  public:
	virtual ~ILogger() = default;

	virtual void log(CLogLevel level, const std::string& message) = 0;
	virtual void setLogLevel(CLogLevel level) = 0;
	virtual CLogLevel getLogLevel() const noexcept = 0;

	/* True when a message at level would be written */
	virtual bool isEnabled(CLogLevel level) const noexcept
	{
		return level >= getLogLevel();
	}

	virtual std::error_code initialize() = 0;
	virtual void shutdown() noexcept = 0;
};

} /* namespace StrataDB */
