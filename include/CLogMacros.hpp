/*-------------------------------------------------------------------------
 *
 * CLogMacros.hpp
 *      Component logging macros for StrataDB.
 *
 *      The enclosing scope must provide logger_, a shared_ptr<ILogger>
 *      that may be null. Message arguments are evaluated only when the
 *      level is enabled, so std::format calls cost nothing otherwise.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "IInterfaces.hpp"

#define elog(loglevel, ...)                                                    \
    do                                                                         \
    {                                                                          \
        if (logger_ && logger_->isEnabled(loglevel))                           \
            logger_->log(loglevel, __VA_ARGS__);                               \
    } while (0)

#define trace_log(...) elog(CLogLevel::TRACE, __VA_ARGS__)
#define debug_log(...) elog(CLogLevel::DEBUG, __VA_ARGS__)
#define info_log(...) elog(CLogLevel::INFO, __VA_ARGS__)
#define warn_log(...) elog(CLogLevel::WARN, __VA_ARGS__)
#define error_log(...) elog(CLogLevel::ERROR, __VA_ARGS__)
#define fatal_log(...) elog(CLogLevel::FATAL, __VA_ARGS__)
