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

#include "migration/MigrationApplication.hpp"

#include "data/cassandra/Schema.hpp"
#include "data/cassandra/SettingsProvider.hpp"
#include "migration/DirectoryResourcesProvider.hpp"
#include "migration/MigrationError.hpp"
#include "migration/MigrationStatus.hpp"
#include "migration/cassandra/CassandraMigrationManager.hpp"
#include "util/OverloadSet.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/log/Logger.hpp"

#include <cassandra.h>
#include <fmt/core.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <variant>

namespace app {

MigrationApplication::MigrationApplication(util::config::ConfigDefinition const& config, MigrateSubCmd command)
    : settingsProvider_{config.getObject("database.cassandra")}
    , handle_{settingsProvider_.getSettings()}
    , cmd_(std::move(command))
{
    auto const scriptsDirectory = config.maybeValue<std::string>("migration.scripts_directory");
    if (not scriptsDirectory.has_value())
        throw std::runtime_error("migration.scripts_directory is not set");

    connect();

    auto expectedMigrationManager = migration::cassandra::makeMigrationManager(
        config, handle_, migration::DirectoryResourcesProvider{*scriptsDirectory}
    );

    if (not expectedMigrationManager)
        throw std::runtime_error("Failed to create migration manager: " + expectedMigrationManager.error().toString());

    migrationManager_ = std::move(expectedMigrationManager).value();
}

void
MigrationApplication::connect()
{
    if (auto const res = handle_.connect(); not res)
        throw std::runtime_error("Could not connect to database: " + res.error());

    auto const keyspace = settingsProvider_.getKeyspace();
    if (auto const res = handle_.execute(data::cassandra::createKeyspaceStatement(settingsProvider_)); not res) {
        // on datastax, creation of keyspaces can be configured to only be done thru the admin interface.
        // this does not mean that the keyspace does not already exist tho.
        if (res.error().code() != CASS_ERROR_SERVER_UNAUTHORIZED)
            throw std::runtime_error("Could not create keyspace " + keyspace + ": " + res.error());
    }

    if (auto const res = handle_.reconnect(keyspace); not res)
        throw std::runtime_error("Could not connect to keyspace " + keyspace + ": " + res.error());

    LOG(log_.info()) << "Connected to keyspace " << keyspace;
}

int
MigrationApplication::run()
{
    return std::visit(
        util::OverloadSet{
            [this](MigrateSubCmd::Status const&) { return printStatus(); },
            [this](MigrateSubCmd::Run const&) { return migrate(); }
        },
        cmd_.state
    );
}

void
MigrationApplication::stop()
{
    LOG(log_.warn()) << "Stop requested; no further script will be started";
    stopSource_.request_stop();
}

int
MigrationApplication::printStatus()
{
    std::cout << "Current Migration Status:" << std::endl;
    auto const allScriptsStatus = migrationManager_->allScriptsStatus();

    if (allScriptsStatus.empty())
        std::cout << "No migration script found" << std::endl;

    for (auto const& [version, description, status] : allScriptsStatus)
        std::cout << fmt::format(
                         "Version {:>6} - {} - {} ({})", version, description, status.toString(), status.nextStep()
                     )
                  << std::endl;

    if (std::ranges::any_of(allScriptsStatus, [](auto const& entry) { return std::get<2>(entry).requiresAttention(); })) {
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int
MigrationApplication::migrate()
{
    auto const result = migrationManager_->runMigrations(stopSource_.get_token());
    if (not result) {
        auto const& failure = result.error();
        std::cerr << "Migration failed";
        if (failure.error.version.has_value())
            std::cerr << " at version " << *failure.error.version;
        std::cerr << ": " << failure.error << std::endl;

        if (failure.lastAppliedVersion.has_value())
            std::cerr << "Last applied version: " << *failure.lastAppliedVersion << std::endl;
        return EXIT_FAILURE;
    }

    if (result->applied.empty()) {
        std::cout << "Schema is up to date" << std::endl;
    } else {
        std::cout << "Applied " << result->applied.size() << " version(s):";
        for (auto const version : result->applied)
            std::cout << ' ' << version;
        std::cout << std::endl;
    }

    for (auto const version : result->observed)
        std::cout << "Version " << version << " was applied by another instance" << std::endl;

    return EXIT_SUCCESS;
}

}  // namespace app
