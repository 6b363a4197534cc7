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

#include "data/cassandra/Handle.hpp"
#include "migration/MigrationError.hpp"
#include "migration/TrackingRecord.hpp"
#include "migration/TrackingStoreInterface.hpp"
#include "migration/cassandra/impl/TrackingSchema.hpp"
#include "util/log/Logger.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace migration::cassandra {

/**
 * @brief Tracking store backed by a table in the migrated keyspace.
 *
 * Statements are not prepared because the table may only come into existence during the run.
 */
class CassandraTrackingStore : public TrackingStoreInterface {
    util::Logger log_{"Migration"};
    std::reference_wrapper<data::cassandra::Handle const> handle_;
    impl::TrackingSchema schema_;

public:
    /**
     * @brief Construct a new Cassandra Tracking Store object
     *
     * @param handle The connected database handle
     * @param qualifiedTable The tracking table including keyspace and table prefix
     */
    CassandraTrackingStore(data::cassandra::Handle const& handle, std::string qualifiedTable);

    [[nodiscard]] std::expected<std::vector<TrackingRecord>, MigrationError>
    getAppliedRecords() const override;

    [[nodiscard]] std::expected<bool, MigrationError>
    recordApplied(TrackingRecord const& record) override;

    [[nodiscard]] std::expected<bool, MigrationError>
    tryAcquireLock(std::string const& owner, std::chrono::seconds ttl) override;

    [[nodiscard]] std::expected<bool, MigrationError>
    renewLock(std::string const& owner, std::chrono::seconds ttl) override;

    std::expected<void, MigrationError>
    releaseLock(std::string const& owner) override;

private:
    [[nodiscard]] std::expected<bool, MigrationError>
    isLockOwner(std::string const& owner) const;
};

}  // namespace migration::cassandra
