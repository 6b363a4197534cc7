//------------------------------------------------------------------------------
/*
    This file is part of cassmig
    Copyright (c) 2024, the cassmig developers.

    Permission to use, copy, modify, and distribute this software for any
    purpose with or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL,  DIRECT,  INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#pragma once

#include "migration/MigrationError.hpp"
#include "migration/TrackingStoreInterface.hpp"
#include "util/log/Logger.hpp"

#include <fmt/core.h>

#include <chrono>
#include <expected>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

namespace migration::impl {

/**
 * @brief Holds the lease lock of the tracking store and releases it when destroyed
 */
class LeaseLock {
    std::shared_ptr<TrackingStoreInterface> store_;
    std::string owner_;
    std::chrono::seconds ttl_;
    util::Logger log_{"Migration"};

    LeaseLock(std::shared_ptr<TrackingStoreInterface> store, std::string owner, std::chrono::seconds ttl)
        : store_{std::move(store)}, owner_{std::move(owner)}, ttl_{ttl}
    {
    }

public:
    /**
     * @brief Timing of lock acquisition
     */
    struct Settings {
        std::chrono::seconds ttl;
        std::chrono::milliseconds timeout;
        std::chrono::milliseconds pollInterval;
    };

    ~LeaseLock()
    {
        if (store_ == nullptr)
            return;

        if (auto const res = store_->releaseLock(owner_); not res) {
            LOG(log_.error()) << "Could not release the migration lock held by " << owner_ << ": " << res.error()
                              << "; it expires on its own after the lock TTL";
        } else {
            LOG(log_.debug()) << "Released the migration lock held by " << owner_;
        }
    }

    LeaseLock(LeaseLock&& other) noexcept
        : store_{std::move(other.store_)}, owner_{std::move(other.owner_)}, ttl_{other.ttl_}
    {
        other.store_ = nullptr;
    }

    LeaseLock(LeaseLock const&) = delete;
    LeaseLock&
    operator=(LeaseLock const&) = delete;
    LeaseLock&
    operator=(LeaseLock&&) = delete;

    /**
     * @brief Push the expiry of the held lock out by another TTL
     *
     * @return Nothing if still held; LockLost if it expired and was taken over, or the store error
     */
    [[nodiscard]] std::expected<void, MigrationError>
    renew() const
    {
        auto const renewed = store_->renewLock(owner_, ttl_);
        if (not renewed)
            return std::unexpected{renewed.error()};

        if (not *renewed) {
            LOG(log_.error()) << "Migration lock of " << owner_ << " expired before it could be renewed";
            return std::unexpected{MigrationError{
                MigrationError::Kind::LockLost,
                fmt::format("migration lock of {} expired or was taken over by another applier", owner_)
            }};
        }

        LOG(log_.trace()) << "Renewed the migration lock of " << owner_ << " for " << ttl_.count() << "s";
        return {};
    }

    /**
     * @brief Poll the store until the lock is taken
     *
     * @param store The tracking store
     * @param owner Identifier of this applier
     * @param settings Lock timing
     * @param stopToken Aborts waiting with Cancelled
     * @return The held lock; LockTimeout, Cancelled or the store error otherwise
     */
    [[nodiscard]] static std::expected<LeaseLock, MigrationError>
    acquire(
        std::shared_ptr<TrackingStoreInterface> const& store,
        std::string const& owner,
        Settings const& settings,
        std::stop_token const& stopToken
    )
    {
        util::Logger const log{"Migration"};
        auto const deadline = std::chrono::steady_clock::now() + settings.timeout;

        while (true) {
            auto const taken = store->tryAcquireLock(owner, settings.ttl);
            if (not taken)
                return std::unexpected{taken.error()};

            if (*taken) {
                LOG(log.info()) << "Acquired the migration lock as " << owner;
                return LeaseLock{store, owner, settings.ttl};
            }

            if (stopToken.stop_requested())
                return std::unexpected{MigrationError{MigrationError::Kind::Cancelled, "cancelled waiting for lock"}};

            if (std::chrono::steady_clock::now() + settings.pollInterval > deadline) {
                return std::unexpected{MigrationError{
                    MigrationError::Kind::LockTimeout,
                    fmt::format("migration lock still held by another applier after {}ms", settings.timeout.count())
                }};
            }

            LOG(log.info()) << "Migration lock is held by another applier; retrying";
            std::this_thread::sleep_for(settings.pollInterval);
        }
    }
};

}  // namespace migration::impl
