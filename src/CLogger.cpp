/*-------------------------------------------------------------------------
 *
 * CLogger.cpp
 *		  Logging system implementation for StrataDB
 *
 * Writes timestamped, pid-tagged lines to stderr and optionally appends
 * them to a log file.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/CLogger.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CLogger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace StrataDB
{

/*
 * CLogger constructor
 *		Initialize logger with configuration
 */
CLogger::CLogger(const CServerConfig& config)
    : config_(config), logFile_(config.logFile), consoleOutput_(true),
      timestampFormat_("%Y-%m-%d %H:%M:%S"),
      logLevel_(parseLevel(config.logLevel)), initialized_(false)
{
}

/*
 * CLogger destructor
 *		Clean up open file streams
 */
CLogger::~CLogger()
{
    shutdown();
}

/*
 * log
 *		Main logging function - write message if level is sufficient
 */
void
CLogger::log(CLogLevel level, const std::string& message)
{
    if (!isEnabled(level))
        return;

    std::string formattedMessage = formatMessage(level, message);
    std::lock_guard<std::mutex> lock(logMutex_);

    if (consoleOutput_)
        writeToConsole(formattedMessage);
    writeToFile(formattedMessage);
}

void
CLogger::setLogLevel(CLogLevel level)
{
    logLevel_ = level;
}

CLogLevel
CLogger::getLogLevel() const noexcept
{
    return logLevel_;
}

/*
 * initialize
 *		Open the log file, if one is configured
 */
std::error_code
CLogger::initialize()
{
    if (initialized_)
        return std::error_code();

    if (!logFile_.empty())
    {
        fileStream_ = std::make_unique<std::ofstream>(logFile_, std::ios::app);
        if (!fileStream_->is_open())
        {
            fileStream_.reset();
            return std::make_error_code(std::errc::io_error);
        }
    }

    initialized_ = true;
    return std::error_code();
}

/*
 * shutdown
 *		Close file streams and clean up resources
 */
void
CLogger::shutdown() noexcept
{
    std::lock_guard<std::mutex> lock(logMutex_);

    if (fileStream_ && fileStream_->is_open())
        fileStream_->close();
    fileStream_.reset();
    initialized_ = false;
}

void
CLogger::setLogFile(const std::string& filename)
{
    logFile_ = filename;
}

void
CLogger::enableConsoleOutput(bool enable)
{
    consoleOutput_ = enable;
}

void
CLogger::setTimestampFormat(const std::string& format)
{
    timestampFormat_ = format;
}

CLogLevel
CLogger::parseLevel(const std::string& name)
{
    std::string upper = name;

    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (upper == "TRACE")
        return CLogLevel::TRACE;
    if (upper == "DEBUG")
        return CLogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING")
        return CLogLevel::WARN;
    if (upper == "ERROR")
        return CLogLevel::ERROR;
    if (upper == "FATAL")
        return CLogLevel::FATAL;
    return CLogLevel::INFO;
}

void
CLogger::writeToConsole(const std::string& message)
{
    std::cerr << message << std::endl;
}

void
CLogger::writeToFile(const std::string& message)
{
    if (fileStream_ && fileStream_->is_open())
    {
        *fileStream_ << message << std::endl;
        fileStream_->flush();
    }
}

/*
 * formatMessage
 *		"<timestamp> <pid> <LEVEL> <component>: <message>"
 */
std::string
CLogger::formatMessage(CLogLevel level, const std::string& message)
{
    std::stringstream ss;
    int pid = static_cast<int>(getpid());
    std::string component =
        config_.serverName.empty() ? "stratadb" : config_.serverName;

    ss << getTimestamp() << " " << pid << " " << logLevelName(level) << " "
       << component << ": " << message;
    return ss.str();
}

std::string
CLogger::getTimestamp() const
{
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    std::stringstream ss;

    localtime_r(&time, &tm);
    ss << std::put_time(&tm, timestampFormat_.c_str());
    return ss.str();
}

bool
CLogger::isEnabled(CLogLevel level) const noexcept
{
    return level >= logLevel_;
}

} /* namespace StrataDB */
