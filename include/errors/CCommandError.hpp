/*-------------------------------------------------------------------------
 *
 * CCommandError.hpp
 *      Error codes and command error type for StrataDB.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace StrataDB
{

using std::string;
using std::vector;

/*
 * Protocol-level error codes. The numeric values are part of the wire
 * contract and must never change.
 */
enum class CErrorCode : int32_t
{
    InternalError = 1,
    BadValue = 2,
    FailedToParse = 9,
    TypeMismatch = 14,
    NamespaceNotFound = 26,
    IndexNotFound = 27,
    UnsuitableValueType = 28,
    ConflictingUpdateOperators = 40,
    NamespaceExists = 48,
    EmptyFieldName = 56,
    CommandNotFound = 59,
    ImmutableField = 66,
    CannotCreateIndex = 67,
    IndexAlreadyExists = 68,
    InvalidOptions = 72,
    InvalidNamespace = 73,
    IndexOptionsConflict = 85,
    IndexKeySpecsConflict = 86,
    InvalidIndexSpecificationOption = 197,
    NotImplemented = 238,
    DuplicateKey = 11000,
    Interrupted = 11601,
    Location10065 = 10065,
    Location15974 = 15974,
    Location15975 = 15975,
    Location15998 = 15998,
    Location16410 = 16410,
    Location28667 = 28667,
    Location28724 = 28724,
    Location31253 = 31253,
    Location31254 = 31254,
    Location40352 = 40352,
    MissingField = 40414,
    Location51024 = 51024,
    Location51075 = 51075,
    Location51091 = 51091,
    Location51108 = 51108
};

string codeName(CErrorCode code);

/*
 * CCommandError
 *		Raised by the core when a command cannot be carried out. The
 *		dispatcher turns it into an { ok: 0, code, codeName, errmsg } reply.
 */
class CCommandError : public std::runtime_error
{
  public:
    CCommandError(CErrorCode code, const string& message);

    CErrorCode code() const noexcept
    {
        return code_;
    }

    int32_t numericCode() const noexcept
    {
        return static_cast<int32_t>(code_);
    }

    string codeName() const;

  private:
    CErrorCode code_;
};

/* Per-document failure inside a batch write */
struct CWriteError
{
    int32_t index;
    CErrorCode code;
    string errmsg;
};

} // namespace StrataDB
