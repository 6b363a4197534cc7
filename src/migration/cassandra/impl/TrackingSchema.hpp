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

#include <fmt/core.h>

#include <string>
#include <utility>

namespace migration::cassandra::impl {

/**
 * @brief The CQL used to read and write the tracking table
 */
class TrackingSchema {
    std::string table_;

public:
    /**
     * @brief Construct a new Tracking Schema object
     *
     * @param qualifiedTable The tracking table name including keyspace and table prefix
     */
    explicit TrackingSchema(std::string qualifiedTable) : table_{std::move(qualifiedTable)}
    {
    }

    [[nodiscard]] std::string const&
    table() const
    {
        return table_;
    }

    /**
     * @return The DDL creating the tracking table; safe to run more than once
     */
    [[nodiscard]] std::string
    createTable() const
    {
        return fmt::format(
            R"(
            CREATE TABLE IF NOT EXISTS {}
                  (
                    version int,
                    description text,
                    applied_at timestamp,
                    checksum text,
                    PRIMARY KEY (version)
                  )
            )",
            table_
        );
    }

    [[nodiscard]] std::string
    selectApplied() const
    {
        return fmt::format(
            R"(
            SELECT version, description, applied_at, checksum
              FROM {}
            )",
            table_
        );
    }

    [[nodiscard]] std::string
    insertApplied() const
    {
        return fmt::format(
            R"(
            INSERT INTO {}
                   (version, description, applied_at, checksum)
            VALUES (?, ?, ?, ?)
                IF NOT EXISTS
            )",
            table_
        );
    }

    [[nodiscard]] std::string
    insertLock() const
    {
        return fmt::format(
            R"(
            INSERT INTO {}
                   (version, description, applied_at)
            VALUES (?, ?, ?)
                IF NOT EXISTS
             USING TTL ?
            )",
            table_
        );
    }

    /**
     * @return Conditional update pushing the lock expiry out by a fresh TTL while the owner still holds it
     */
    [[nodiscard]] std::string
    renewLock() const
    {
        return fmt::format(
            R"(
            UPDATE {}
             USING TTL ?
               SET description = ?, applied_at = ?
             WHERE version = ?
                IF description = ?
            )",
            table_
        );
    }

    [[nodiscard]] std::string
    selectLockOwner() const
    {
        return fmt::format(
            R"(
            SELECT description
              FROM {}
             WHERE version = ?
            )",
            table_
        );
    }

    [[nodiscard]] std::string
    deleteLock() const
    {
        return fmt::format(
            R"(
            DELETE FROM {}
             WHERE version = ?
                IF description = ?
            )",
            table_
        );
    }
};

}  // namespace migration::cassandra::impl
