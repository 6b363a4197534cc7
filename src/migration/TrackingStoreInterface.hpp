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
#include "migration/TrackingRecord.hpp"
#include "migration/Types.hpp"

#include <chrono>
#include <expected>
#include <set>
#include <string>
#include <vector>

namespace migration {

/**
 * @brief Persistent record of the applied versions, kept inside the migrated cluster.
 *
 * Also hosts the lease lock serializing appliers. All conditional operations map to lightweight transactions, which
 * are the only cross-process serialization point of a run.
 */
struct TrackingStoreInterface {
    virtual ~TrackingStoreInterface() = default;

    /**
     * @brief Read every applied record
     *
     * @return Records ascending by version; Connectivity or TrackingStoreMissing error otherwise
     */
    [[nodiscard]] virtual std::expected<std::vector<TrackingRecord>, MigrationError>
    getAppliedRecords() const = 0;

    /**
     * @brief Read the set of applied versions
     *
     * @return The versions; same errors as @ref getAppliedRecords
     */
    [[nodiscard]] virtual std::expected<std::set<Version>, MigrationError>
    getAppliedVersions() const
    {
        return getAppliedRecords().transform([](auto const& records) {
            std::set<Version> versions;
            for (auto const& record : records)
                versions.insert(record.version);
            return versions;
        });
    }

    /**
     * @brief Record a version as applied unless a record for it already exists
     *
     * @param record The record to write
     * @return true if written; false if the version was already recorded; TrackingWriteFailed error otherwise
     */
    [[nodiscard]] virtual std::expected<bool, MigrationError>
    recordApplied(TrackingRecord const& record) = 0;

    /**
     * @brief Try to take the lease lock once
     *
     * @param owner Identifier of this applier
     * @param ttl Time after which an abandoned lock expires
     * @return true if taken by this owner; false if held by somebody else
     */
    [[nodiscard]] virtual std::expected<bool, MigrationError>
    tryAcquireLock(std::string const& owner, std::chrono::seconds ttl) = 0;

    /**
     * @brief Extend the lease lock by a fresh TTL
     *
     * @param owner Identifier of this applier
     * @param ttl New time until the lock expires
     * @return true if still held by this owner; false if the lock expired or was taken over
     */
    [[nodiscard]] virtual std::expected<bool, MigrationError>
    renewLock(std::string const& owner, std::chrono::seconds ttl) = 0;

    /**
     * @brief Release the lease lock if held by the given owner
     *
     * @param owner Identifier of this applier
     * @return Nothing or the error
     */
    virtual std::expected<void, MigrationError>
    releaseLock(std::string const& owner) = 0;
};

}  // namespace migration
