/*-------------------------------------------------------------------------
 *
 * CCommandError.cpp
 *      Error codes and command error type for StrataDB.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "errors/CCommandError.hpp"

namespace StrataDB
{

string
codeName(CErrorCode code)
{
    switch (code)
    {
    case CErrorCode::InternalError:
        return "InternalError";
    case CErrorCode::BadValue:
        return "BadValue";
    case CErrorCode::FailedToParse:
        return "FailedToParse";
    case CErrorCode::TypeMismatch:
        return "TypeMismatch";
    case CErrorCode::NamespaceNotFound:
        return "NamespaceNotFound";
    case CErrorCode::IndexNotFound:
        return "IndexNotFound";
    case CErrorCode::UnsuitableValueType:
        return "UnsuitableValueType";
    case CErrorCode::ConflictingUpdateOperators:
        return "ConflictingUpdateOperators";
    case CErrorCode::NamespaceExists:
        return "NamespaceExists";
    case CErrorCode::EmptyFieldName:
        return "EmptyFieldName";
    case CErrorCode::CommandNotFound:
        return "CommandNotFound";
    case CErrorCode::ImmutableField:
        return "ImmutableField";
    case CErrorCode::CannotCreateIndex:
        return "CannotCreateIndex";
    case CErrorCode::IndexAlreadyExists:
        return "IndexAlreadyExists";
    case CErrorCode::InvalidOptions:
        return "InvalidOptions";
    case CErrorCode::InvalidNamespace:
        return "InvalidNamespace";
    case CErrorCode::IndexOptionsConflict:
        return "IndexOptionsConflict";
    case CErrorCode::IndexKeySpecsConflict:
        return "IndexKeySpecsConflict";
    case CErrorCode::InvalidIndexSpecificationOption:
        return "InvalidIndexSpecificationOption";
    case CErrorCode::NotImplemented:
        return "NotImplemented";
    case CErrorCode::DuplicateKey:
        return "DuplicateKey";
    case CErrorCode::Interrupted:
        return "Interrupted";
    case CErrorCode::Location10065:
    case CErrorCode::Location15974:
    case CErrorCode::Location15975:
    case CErrorCode::Location15998:
    case CErrorCode::Location16410:
    case CErrorCode::Location28667:
    case CErrorCode::Location28724:
    case CErrorCode::Location31253:
    case CErrorCode::Location31254:
    case CErrorCode::Location40352:
    case CErrorCode::MissingField:
    case CErrorCode::Location51024:
    case CErrorCode::Location51075:
    case CErrorCode::Location51091:
    case CErrorCode::Location51108:
        return "Location" + std::to_string(static_cast<int32_t>(code));
    }
    return "Unknown";
}

CCommandError::CCommandError(CErrorCode code, const string& message)
    : std::runtime_error(message), code_(code)
{
}

string
CCommandError::codeName() const
{
    return StrataDB::codeName(code_);
}

} // namespace StrataDB
