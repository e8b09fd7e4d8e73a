/*-------------------------------------------------------------------------
 *
 * CLogger.hpp
 *      Logging system implementation for StrataDB.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once
#include "CServerConfig.hpp"
#include "IInterfaces.hpp"

#include <atomic>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace StrataDB
{

class CLogger : public ILogger
{
  public:
    explicit CLogger(const CServerConfig& config);
    virtual ~CLogger();
    void log(CLogLevel level, const std::string& message) override;
    void setLogLevel(CLogLevel level) override;
    CLogLevel getLogLevel() const noexcept override;
    bool isEnabled(CLogLevel level) const noexcept override;
    std::error_code initialize() override;
    void shutdown() noexcept override;
    void setLogFile(const std::string& filename);
    void enableConsoleOutput(bool enable);
    void setTimestampFormat(const std::string& format);

    /* "DEBUG", "info", ...; unknown names map to INFO */
    static CLogLevel parseLevel(const std::string& name);

  private:
    CServerConfig config_;
    std::string logFile_;
    bool consoleOutput_;
    std::string timestampFormat_;
    std::atomic<CLogLevel> logLevel_;
    std::unique_ptr<std::ofstream> fileStream_;
    std::mutex logMutex_;
    std::atomic<bool> initialized_;
    void writeToConsole(const std::string& message);
    void writeToFile(const std::string& message);
    std::string formatMessage(CLogLevel level, const std::string& message);
    std::string getTimestamp() const;
};

} /* namespace StrataDB */
