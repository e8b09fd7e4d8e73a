/*-------------------------------------------------------------------------
 *
 * CCancellationToken.hpp
 *      Cooperative cancellation flag shared between a caller and a
 *      running command.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <atomic>
#include <memory>

namespace StrataDB
{

/*
 * CCancellationToken
 *		Copies share one flag. A default constructed token is live and can
 *		be cancelled like any other.
 */
class CCancellationToken
{
  public:
    CCancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false))
    {
    }

    void cancel() noexcept
    {
        cancelled_->store(true);
    }

    bool isCancelled() const noexcept
    {
        return cancelled_->load();
    }

    /* Raises Interrupted once cancel() has been called */
    void check() const;

  private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace StrataDB
