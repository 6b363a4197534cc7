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
#include "data/cassandra/Types.hpp"
#include "migration/MigrationError.hpp"
#include "migration/SchemaAgreementExecutorInterface.hpp"
#include "migration/impl/AgreementWaiter.hpp"
#include "util/config/ObjectView.hpp"
#include "util/log/Logger.hpp"

#include <cassandra.h>

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace migration::cassandra {

/**
 * @brief Executes schema changes and waits for agreement by reading `system.local` and `system.peers`.
 *
 * The coordinator of the change lists its peers, and each peer reports its own `system.local` schema version.
 * Peers the driver can't reach are left out.
 */
class CassandraSchemaAgreementExecutor : public SchemaAgreementExecutorInterface {
public:
    static constexpr uint16_t kDEFAULT_NATIVE_PORT = 9042;

    /**
     * @brief Timing of the agreement wait
     */
    struct Settings {
        std::chrono::milliseconds agreementTimeout = std::chrono::seconds{10};
        std::chrono::milliseconds pollInterval = std::chrono::milliseconds{200};
        uint16_t nativePort = kDEFAULT_NATIVE_PORT;

        /**
         * @brief Read the settings from the config
         *
         * @param migrationConfig The `migration` section
         * @param cassandraConfig The `database.cassandra` section
         * @return The settings
         */
        static Settings
        make(util::config::ObjectView const& migrationConfig, util::config::ObjectView const& cassandraConfig);
    };

private:
    util::Logger log_{"Migration"};
    std::reference_wrapper<data::cassandra::Handle const> handle_;
    Settings settings_;
    data::cassandra::PreparedStatement selectLocal_;
    data::cassandra::PreparedStatement selectPeers_;

public:
    /**
     * @brief Construct a new executor
     *
     * @throws std::runtime_error if the system tables can't be prepared
     *
     * @param handle The connected database handle
     * @param settings The agreement timing
     */
    CassandraSchemaAgreementExecutor(data::cassandra::Handle const& handle, Settings settings);

    std::expected<void, MigrationError>
    executeWithAgreement(std::string const& statement) override;

private:
    [[nodiscard]] std::expected<std::optional<std::string>, MigrationError>
    readSchemaVersion(CassNode const* coordinator, std::optional<std::string> const& node) const;

    [[nodiscard]] std::expected<std::vector<std::string>, MigrationError>
    readPeers(CassNode const* coordinator) const;
};

}  // namespace migration::cassandra
