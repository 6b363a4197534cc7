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

#include "migration/cassandra/CassandraTrackingStore.hpp"

#include "data/cassandra/Handle.hpp"
#include "data/cassandra/Types.hpp"
#include "migration/MigrationError.hpp"
#include "migration/TrackingRecord.hpp"
#include "migration/Types.hpp"
#include "migration/cassandra/impl/ErrorMapping.hpp"
#include "util/log/Logger.hpp"

#include <cassandra.h>
#include <fmt/core.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace migration::cassandra {

namespace {

// conditional writes and the reads deciding on them go through paxos
data::cassandra::Statement
makeConditional(data::cassandra::Statement statement)
{
    statement.setSerialConsistency(CASS_CONSISTENCY_SERIAL);
    return statement;
}

}  // namespace

CassandraTrackingStore::CassandraTrackingStore(data::cassandra::Handle const& handle, std::string qualifiedTable)
    : handle_{handle}, schema_{std::move(qualifiedTable)}
{
}

std::expected<std::vector<TrackingRecord>, MigrationError>
CassandraTrackingStore::getAppliedRecords() const
{
    auto const res = handle_.get().execute(schema_.selectApplied());
    if (not res) {
        LOG(log_.debug()) << "Reading " << schema_.table() << " failed: " << res.error();
        return std::unexpected{impl::toTrackingReadError(res.error(), schema_.table())};
    }

    std::vector<TrackingRecord> records;
    try {
        for (auto const& [version, description, appliedAt, checksum] : data::cassandra::extract<
                 int32_t,
                 std::optional<std::string>,
                 std::optional<std::chrono::system_clock::time_point>,
                 std::optional<std::string>>(res.value())) {
            if (version == kLOCK_VERSION)
                continue;

            records.push_back(TrackingRecord{
                .version = version,
                .description = description.value_or(""),
                .appliedAt = appliedAt.value_or(std::chrono::system_clock::time_point{}),
                .checksum = checksum
            });
        }
    } catch (std::logic_error const& e) {
        // extraction throws when the existing table has different column types
        LOG(log_.error()) << "Unexpected layout of " << schema_.table() << ": " << e.what();
        return std::unexpected{MigrationError{
            MigrationError::Kind::ExecutionError,
            fmt::format("tracking table {} has an unexpected layout: {}", schema_.table(), e.what())
        }};
    }

    std::ranges::sort(records, {}, &TrackingRecord::version);
    return records;
}

std::expected<bool, MigrationError>
CassandraTrackingStore::recordApplied(TrackingRecord const& record)
{
    auto const statement = makeConditional(data::cassandra::Statement{
        schema_.insertApplied(), record.version, record.description, record.appliedAt, record.checksum
    });

    auto const res = handle_.get().execute(statement);
    if (not res) {
        LOG(log_.error()) << "Recording version " << record.version << " failed: " << res.error();
        // the schema change of this version already went through
        auto const err = MigrationError{
            MigrationError::Kind::TrackingWriteFailed,
            fmt::format("recording version {} failed: {}", record.version, res.error().message())
        };
        return std::unexpected{err.withVersion(record.version)};
    }

    auto const applied = res->get<bool>().value_or(false);
    LOG(log_.debug()) << "Recorded version " << record.version << "; applied = " << applied;
    return applied;
}

std::expected<bool, MigrationError>
CassandraTrackingStore::tryAcquireLock(std::string const& owner, std::chrono::seconds ttl)
{
    auto const statement = makeConditional(data::cassandra::Statement{
        schema_.insertLock(),
        kLOCK_VERSION,
        owner,
        std::chrono::system_clock::now(),
        static_cast<int32_t>(ttl.count())
    });

    auto const res = handle_.get().execute(statement);
    if (not res) {
        LOG(log_.warn()) << "Taking the migration lock failed: " << res.error();
        return std::unexpected{
            impl::toMigrationError(res.error(), MigrationError::Kind::ExecutionError, "taking the migration lock")
        };
    }

    if (res->get<bool>().value_or(false))
        return true;

    // a previous attempt may have succeeded even though its response was lost
    return isLockOwner(owner);
}

std::expected<bool, MigrationError>
CassandraTrackingStore::renewLock(std::string const& owner, std::chrono::seconds ttl)
{
    auto const statement = makeConditional(data::cassandra::Statement{
        schema_.renewLock(),
        static_cast<int32_t>(ttl.count()),
        owner,
        std::chrono::system_clock::now(),
        kLOCK_VERSION,
        owner
    });

    auto const res = handle_.get().execute(statement);
    if (not res) {
        LOG(log_.warn()) << "Renewing the migration lock failed: " << res.error();
        return std::unexpected{
            impl::toMigrationError(res.error(), MigrationError::Kind::ExecutionError, "renewing the migration lock")
        };
    }

    auto const renewed = res->get<bool>().value_or(false);
    LOG(log_.trace()) << "Renewed the migration lock for " << owner << "; applied = " << renewed;
    return renewed;
}

std::expected<void, MigrationError>
CassandraTrackingStore::releaseLock(std::string const& owner)
{
    auto const statement = makeConditional(data::cassandra::Statement{schema_.deleteLock(), kLOCK_VERSION, owner});
    auto const res = handle_.get().execute(statement);
    if (not res) {
        return std::unexpected{
            impl::toMigrationError(res.error(), MigrationError::Kind::ExecutionError, "releasing the migration lock")
        };
    }

    if (not res->get<bool>().value_or(false))
        LOG(log_.warn()) << "Migration lock was not held by " << owner << " when releasing it";

    return {};
}

std::expected<bool, MigrationError>
CassandraTrackingStore::isLockOwner(std::string const& owner) const
{
    auto statement = data::cassandra::Statement{schema_.selectLockOwner(), kLOCK_VERSION};
    statement.setConsistency(CASS_CONSISTENCY_SERIAL);

    auto const res = handle_.get().execute(statement);
    if (not res) {
        return std::unexpected{
            impl::toMigrationError(res.error(), MigrationError::Kind::ExecutionError, "reading the migration lock")
        };
    }

    auto const holder = res->get<std::optional<std::string>>();
    if (holder.has_value() and holder->has_value()) {
        LOG(log_.trace()) << "Migration lock is held by " << **holder;
        return **holder == owner;
    }
    return false;
}

}  // namespace migration::cassandra
