/*-------------------------------------------------------------------------
 *
 * CCancellationToken.cpp
 *      Cooperative cancellation flag.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "runtime/CCancellationToken.hpp"

#include "errors/CCommandError.hpp"
#include "errors/CErrorMessages.hpp"

namespace StrataDB
{

void
CCancellationToken::check() const
{
    if (isCancelled())
        throw CCommandError(CErrorCode::Interrupted,
                            CErrorMessages::interrupted());
}

} // namespace StrataDB
