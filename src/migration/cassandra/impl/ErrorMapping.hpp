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

#include "data/cassandra/Error.hpp"
#include "migration/MigrationError.hpp"

#include <string_view>

namespace migration::cassandra::impl {

/**
 * @brief Classify a driver error.
 *
 * Unreachable cluster conditions become Connectivity; everything else becomes the given fallback kind.
 *
 * @param err The driver error
 * @param fallback Kind to use when the error is not a connectivity problem
 * @param context Short description of the failed operation prefixed to the message
 * @return The classified error
 */
[[nodiscard]] MigrationError
toMigrationError(data::cassandra::CassandraError const& err, MigrationError::Kind fallback, std::string_view context);

/**
 * @brief Classify a driver error raised while reading the tracking table
 *
 * @param err The driver error
 * @param table The qualified tracking table name
 * @return TrackingStoreMissing for a missing table, Connectivity for an unreachable cluster, ExecutionError otherwise
 */
[[nodiscard]] MigrationError
toTrackingReadError(data::cassandra::CassandraError const& err, std::string_view table);

}  // namespace migration::cassandra::impl
