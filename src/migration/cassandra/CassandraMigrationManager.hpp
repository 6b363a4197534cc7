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
#include "migration/MigrationManagerInterface.hpp"
#include "migration/MigrationResources.hpp"
#include "migration/MigrationResourcesProviderInterface.hpp"
#include "util/config/ConfigDefinition.hpp"

#include <expected>
#include <memory>
#include <string>

namespace migration::cassandra {

/**
 * @brief Add the built-in tracking table script as version 1 unless the registry already has a version 1
 *
 * @param resources The registry
 * @param qualifiedTable The tracking table including keyspace and table prefix
 * @return The registry including a version 1
 */
[[nodiscard]] std::expected<MigrationResources, MigrationError>
withInitializeScript(MigrationResources const& resources, std::string const& qualifiedTable);

/**
 * @brief A factory function that creates the migration manager for a connected cluster.
 *
 * @param config The config
 * @param handle The handle; it must be connected before calling this function and outlive the manager
 * @param provider Produces the registry
 * @return The manager, or the error loading the registry or preparing the cluster access
 */
[[nodiscard]] std::expected<std::shared_ptr<MigrationManagerInterface>, MigrationError>
makeMigrationManager(
    util::config::ConfigDefinition const& config,
    data::cassandra::Handle const& handle,
    MigrationResourcesProviderInterface const& provider
);

}  // namespace migration::cassandra
