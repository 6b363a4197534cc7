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

#include "migration/cassandra/CassandraSchemaAgreementExecutor.hpp"

#include "data/cassandra/Handle.hpp"
#include "migration/MigrationError.hpp"
#include "migration/cassandra/impl/ErrorMapping.hpp"
#include "migration/impl/AgreementWaiter.hpp"
#include "util/config/ObjectView.hpp"
#include "util/log/Logger.hpp"

#include <cassandra.h>
#include <fmt/core.h>

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace migration::cassandra {

CassandraSchemaAgreementExecutor::Settings
CassandraSchemaAgreementExecutor::Settings::make(
    util::config::ObjectView const& migrationConfig,
    util::config::ObjectView const& cassandraConfig
)
{
    return Settings{
        .agreementTimeout = std::chrono::seconds{migrationConfig.get<uint32_t>("agreement_timeout")},
        .pollInterval = std::chrono::milliseconds{migrationConfig.get<uint32_t>("agreement_poll_interval")},
        .nativePort = cassandraConfig.maybeValue<uint16_t>("port").value_or(kDEFAULT_NATIVE_PORT)
    };
}

CassandraSchemaAgreementExecutor::CassandraSchemaAgreementExecutor(
    data::cassandra::Handle const& handle,
    Settings settings
)
    : handle_{handle}
    , settings_{settings}
    , selectLocal_{handle.prepare("SELECT schema_version FROM system.local WHERE key = 'local'")}
    , selectPeers_{handle.prepare("SELECT peer, rpc_address FROM system.peers")}
{
}

std::expected<void, MigrationError>
CassandraSchemaAgreementExecutor::executeWithAgreement(std::string const& statement)
{
    LOG(log_.debug()) << "Executing: " << statement;

    // the coordinator node handed out by the driver lives as long as this future
    auto const future = handle_.get().asyncExecute(data::cassandra::Statement{statement});
    if (auto const res = future.get(); not res) {
        LOG(log_.error()) << "Statement failed: " << res.error();
        return std::unexpected{
            impl::toMigrationError(res.error(), MigrationError::Kind::ExecutionError, "executing statement")
        };
    }

    auto const* coordinator = future.coordinator();
    return migration::impl::waitForAgreement(
        [this, coordinator]() {
            return migration::impl::collectSchemaVersions(
                [this, coordinator](std::optional<std::string> const& node) {
                    return readSchemaVersion(coordinator, node);
                },
                [this, coordinator]() { return readPeers(coordinator); },
                log_
            );
        },
        settings_.agreementTimeout,
        settings_.pollInterval,
        log_
    );
}

std::expected<std::optional<std::string>, MigrationError>
CassandraSchemaAgreementExecutor::readSchemaVersion(
    CassNode const* coordinator,
    std::optional<std::string> const& node
) const
{
    auto const statement = selectLocal_.bind();
    try {
        if (node.has_value()) {
            statement.setHost(*node, settings_.nativePort);
        } else if (coordinator != nullptr) {
            statement.setNode(coordinator);
        }
    } catch (std::logic_error const& e) {
        return std::unexpected{MigrationError{MigrationError::Kind::ExecutionError, e.what()}};
    }

    auto const res = handle_.get().execute(statement);
    if (not res) {
        return std::unexpected{impl::toMigrationError(
            res.error(),
            MigrationError::Kind::ExecutionError,
            fmt::format("reading system.local of {}", node.value_or("the coordinator"))
        )};
    }

    return res->get<std::optional<std::string>>().value_or(std::nullopt);
}

std::expected<std::vector<std::string>, MigrationError>
CassandraSchemaAgreementExecutor::readPeers(CassNode const* coordinator) const
{
    auto const statement = selectPeers_.bind();
    std::vector<std::string> peers;
    try {
        if (coordinator != nullptr)
            statement.setNode(coordinator);

        auto const res = handle_.get().execute(statement);
        if (not res) {
            return std::unexpected{
                impl::toMigrationError(res.error(), MigrationError::Kind::ExecutionError, "reading system.peers")
            };
        }

        for (auto const& [peer, rpcAddress] :
             data::cassandra::extract<std::string, std::optional<std::string>>(res.value())) {
            // nodes listening on all interfaces advertise the wildcard address
            if (rpcAddress.has_value() and *rpcAddress != "0.0.0.0" and *rpcAddress != "::") {
                peers.push_back(*rpcAddress);
            } else {
                peers.push_back(peer);
            }
        }
    } catch (std::logic_error const& e) {
        return std::unexpected{MigrationError{MigrationError::Kind::ExecutionError, e.what()}};
    }
    return peers;
}

}  // namespace migration::cassandra
