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

#include "migration/cassandra/CassandraMigrationManager.hpp"

#include "data/cassandra/Handle.hpp"
#include "data/cassandra/Schema.hpp"
#include "data/cassandra/SettingsProvider.hpp"
#include "migration/MigrationEngine.hpp"
#include "migration/MigrationError.hpp"
#include "migration/MigrationManagerInterface.hpp"
#include "migration/MigrationResources.hpp"
#include "migration/MigrationResourcesProviderInterface.hpp"
#include "migration/MigrationScript.hpp"
#include "migration/Types.hpp"
#include "migration/cassandra/CassandraSchemaAgreementExecutor.hpp"
#include "migration/cassandra/CassandraTrackingStore.hpp"
#include "migration/cassandra/InitializeScript.hpp"
#include "migration/impl/MigrationManagerBase.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/log/Logger.hpp"

#include <exception>
#include <expected>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace migration::cassandra {

std::expected<MigrationResources, MigrationError>
withInitializeScript(MigrationResources const& resources, std::string const& qualifiedTable)
{
    if (resources.find(kINITIALIZE_VERSION) != nullptr)
        return resources;

    std::vector<MigrationScript> scripts(resources.begin(), resources.end());
    scripts.push_back(makeInitializeScript(qualifiedTable));
    return makeMigrationResources(std::move(scripts));
}

std::expected<std::shared_ptr<MigrationManagerInterface>, MigrationError>
makeMigrationManager(
    util::config::ConfigDefinition const& config,
    data::cassandra::Handle const& handle,
    MigrationResourcesProviderInterface const& provider
)
{
    auto const migrationConfig = config.getObject("migration");
    auto const settingsProvider = data::cassandra::SettingsProvider{config.getObject("database.cassandra")};
    auto const table =
        data::cassandra::qualifiedTableName(settingsProvider, migrationConfig.get<std::string>("tracking_table"));

    auto resources = provider.load();
    if (not resources)
        return std::unexpected{resources.error()};

    if (migrationConfig.get<bool>("bootstrap_tracking_table")) {
        resources = withInitializeScript(*resources, table);
        if (not resources)
            return std::unexpected{resources.error()};
    }

    LOG(util::LogService::info()) << "Registered " << resources->size() << " migration script(s); tracking table "
                                  << table;

    try {
        auto store = std::make_shared<CassandraTrackingStore>(handle, table);
        auto executor = std::make_shared<CassandraSchemaAgreementExecutor>(
            handle,
            CassandraSchemaAgreementExecutor::Settings::make(migrationConfig, config.getObject("database.cassandra"))
        );

        return std::make_shared<migration::impl::MigrationManagerBase>(
            std::move(store), std::move(executor), std::move(resources).value(), EngineSettings::make(migrationConfig)
        );
    } catch (std::exception const& e) {
        return std::unexpected{MigrationError{
            MigrationError::Kind::Connectivity, std::string{"Could not prepare access to the cluster: "} + e.what()
        }};
    }
}

}  // namespace migration::cassandra
