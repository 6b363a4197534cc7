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

#include "migration/cassandra/impl/ErrorMapping.hpp"

#include "data/cassandra/Error.hpp"
#include "migration/MigrationError.hpp"

#include <fmt/core.h>

#include <string_view>

namespace migration::cassandra::impl {

MigrationError
toMigrationError(data::cassandra::CassandraError const& err, MigrationError::Kind fallback, std::string_view context)
{
    auto const kind = err.isConnectivityError() ? MigrationError::Kind::Connectivity : fallback;
    return MigrationError{kind, fmt::format("{}: {} (code {})", context, err.message(), err.code())};
}

MigrationError
toTrackingReadError(data::cassandra::CassandraError const& err, std::string_view table)
{
    if (err.isUnconfiguredTable()) {
        return MigrationError{
            MigrationError::Kind::TrackingStoreMissing, fmt::format("tracking table {} does not exist", table)
        };
    }
    return toMigrationError(err, MigrationError::Kind::ExecutionError, fmt::format("reading {}", table));
}

}  // namespace migration::cassandra::impl
