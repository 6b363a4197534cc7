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

#include "util/Assert.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <ostream>
#include <string_view>

namespace util::config {

/**
 * @brief All the config descriptions are stored and extracted from this class
 *
 * Represents all the possible config descriptions; used to generate the markdown reference of the config
 */
struct CassmigConfigDescription {
public:
    /** @brief Struct to represent a key-value pair*/
    struct KV {
        std::string_view key;
        std::string_view value;
    };

    constexpr CassmigConfigDescription() = default;

    /**
     * @brief Retrieves the description for a given key
     *
     * @param key The key to look up the description for
     * @return The description associated with the key
     */
    [[nodiscard]] static constexpr std::string_view
    get(std::string_view key)
    {
        auto const itr = std::ranges::find_if(kCONFIG_DESCRIPTION, [&](auto const& v) { return v.key == key; });
        ASSERT(itr != kCONFIG_DESCRIPTION.end(), "Key {} doesn't exist in config", key);
        return itr->value;
    }

    /**
     * @brief Whether a description exists for the given key
     *
     * @param key The key
     * @return true if described
     */
    [[nodiscard]] static constexpr bool
    contains(std::string_view key)
    {
        return std::ranges::any_of(kCONFIG_DESCRIPTION, [&](auto const& v) { return v.key == key; });
    }

    /**
     * @brief Write the markdown reference of all keys
     *
     * @param stream Where to write
     */
    static void
    writeMarkdown(std::ostream& stream)
    {
        stream << "# Configuration keys\n\n";
        for (auto const& [key, value] : kCONFIG_DESCRIPTION)
            stream << fmt::format("### {}\n\n{}\n\n", key, value);
    }

private:
    static constexpr auto kCONFIG_DESCRIPTION = std::array{
        KV{.key = "database.cassandra.contact_points",
           .value = "Comma separated IP addresses or hostnames of the initial cluster nodes to connect to."},
        KV{.key = "database.cassandra.secure_connect_bundle",
           .value = "Path of a cloud secure connection bundle. Used instead of the contact points when set."},
        KV{.key = "database.cassandra.port", .value = "Port number to connect to Cassandra."},
        KV{.key = "database.cassandra.keyspace", .value = "Keyspace to migrate. Created when missing."},
        KV{.key = "database.cassandra.replication_factor",
           .value = "Replication factor used when the keyspace has to be created."},
        KV{.key = "database.cassandra.table_prefix", .value = "Prefix for all table names, including the tracking table."},
        KV{.key = "database.cassandra.threads", .value = "Number of IO threads of the driver."},
        KV{.key = "database.cassandra.core_connections_per_host",
           .value = "Number of connections per host the driver keeps open."},
        KV{.key = "database.cassandra.connect_timeout",
           .value = "The maximum amount of time in seconds to wait for a connection to be established."},
        KV{.key = "database.cassandra.request_timeout",
           .value = "The maximum amount of time in seconds to wait for a single request."},
        KV{.key = "database.cassandra.username", .value = "The username used for authenticating with the database."},
        KV{.key = "database.cassandra.password", .value = "The password used for authenticating with the database."},
        KV{.key = "database.cassandra.certfile",
           .value = "The path to the SSL/TLS certificate file used to establish a secure connection."},
        KV{.key = "database.cassandra.driver_log", .value = "Enable the trace log of the Cassandra driver."},
        KV{.key = "migration.tracking_table", .value = "Name of the table recording the applied versions."},
        KV{.key = "migration.scripts_directory",
           .value = "Directory with V<version>__<description>.cql scripts. Required by the `run` and `status` commands."},
        KV{.key = "migration.bootstrap_tracking_table",
           .value = "Register the built-in script creating the tracking table as version 1 when no script has that "
                    "version."},
        KV{.key = "migration.agreement_timeout",
           .value = "Seconds to wait for schema agreement after each statement."},
        KV{.key = "migration.agreement_poll_interval",
           .value = "Milliseconds between two reads of the schema versions of the cluster."},
        KV{.key = "migration.lock_timeout", .value = "Seconds to wait for the migration lock held by another applier."},
        KV{.key = "migration.lock_ttl",
           .value = "Seconds after which the migration lock of a crashed applier expires."},
        KV{.key = "migration.lock_poll_interval", .value = "Milliseconds between two attempts to take the lock."},
        KV{.key = "migration.run_timeout",
           .value = "Seconds after which no further script is started. Unlimited when not set."},
        KV{.key = "migration.validate_checksums",
           .value = "Fail when an applied script has been changed since it was applied."},
        KV{.key = "log_channels.[].channel", .value = "Name of the log channel."},
        KV{.key = "log_channels.[].log_level", .value = "Log level for the log channel."},
        KV{.key = "log_level", .value = "General logging level."},
        KV{.key = "log_format", .value = "Format string for log messages."},
        KV{.key = "log_to_console", .value = "Enable or disable logging to console."},
        KV{.key = "log_directory", .value = "Directory path for log files."},
        KV{.key = "log_rotation_size", .value = "Log rotation size in megabytes."},
        KV{.key = "log_directory_max_size", .value = "Maximum size of the log directory in megabytes."},
        KV{.key = "log_rotation_hour_interval", .value = "Interval in hours for log rotation."},
    };
};

}  // namespace util::config
