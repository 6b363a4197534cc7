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
#include "data/cassandra/SettingsProvider.hpp"
#include "migration/MigrationManagerInterface.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/log/Logger.hpp"

#include <memory>
#include <stop_token>
#include <variant>

namespace app {

/**
 * @brief The command to run for migration framework
 */
struct MigrateSubCmd {
    /**
     * @brief Check the status of the migrations
     */
    struct Status {};
    /**
     * @brief Apply all pending migrations
     */
    struct Run {};

    std::variant<Status, Run> state;

    /**
     * @brief Helper function to create a status command
     *
     * @return Cmd object containing the status command
     */
    static MigrateSubCmd
    status()
    {
        return MigrateSubCmd{Status{}};
    }

    /**
     * @brief Helper function to create a run command
     *
     * @return Cmd object containing the run command
     */
    static MigrateSubCmd
    run()
    {
        return MigrateSubCmd{Run{}};
    }
};

/**
 * @brief The migration application class
 *
 * Connects to the cluster, creating the keyspace if needed, and runs the given command.
 */
class MigrationApplication {
    util::Logger log_{"Migration"};
    data::cassandra::SettingsProvider settingsProvider_;
    data::cassandra::Handle handle_;
    std::shared_ptr<migration::MigrationManagerInterface> migrationManager_;
    MigrateSubCmd cmd_;
    std::stop_source stopSource_;

public:
    /**
     * @brief Construct a new MigrationApplication object
     *
     * @throws std::runtime_error if the cluster can't be reached or the scripts can't be loaded
     *
     * @param config The configuration of the application
     * @param command The command to run
     */
    MigrationApplication(util::config::ConfigDefinition const& config, MigrateSubCmd command);

    /**
     * @brief Run the application
     *
     * @return exit code
     */
    int
    run();

    /**
     * @brief Request the migration run to stop before the next script
     */
    void
    stop();

private:
    void
    connect();

    int
    printStatus();

    int
    migrate();
};

}  // namespace app
