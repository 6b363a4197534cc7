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

#include "data/cassandra/SettingsProvider.hpp"

#include "data/cassandra/Types.hpp"
#include "data/cassandra/impl/Cluster.hpp"
#include "util/config/ObjectView.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <ios>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace data::cassandra {

SettingsProvider::SettingsProvider(util::config::ObjectView const& cfg)
    : config_{cfg}
    , keyspace_{cfg.get<std::string>("keyspace")}
    , tablePrefix_{cfg.maybeValue<std::string>("table_prefix")}
    , replicationFactor_{cfg.get<uint16_t>("replication_factor")}
    , settings_{parseSettings()}
{
}

Settings
SettingsProvider::getSettings() const
{
    return settings_;
}

std::optional<std::string>
SettingsProvider::parseOptionalCertificate() const
{
    if (auto const certPath = config_.maybeValue<std::string>("certfile"); certPath.has_value()) {
        auto const path = boost::filesystem::path(*certPath);
        boost::system::error_code ec;
        if (not boost::filesystem::exists(path, ec) or ec)
            throw std::system_error(errno, std::generic_category(), "certfile '" + path.string() + "' not found");

        std::ifstream fileStream(path.string(), std::ios::in);
        if (!fileStream)
            throw std::system_error(errno, std::generic_category(), "Opening certificate " + path.string());

        std::string contents(std::istreambuf_iterator<char>{fileStream}, std::istreambuf_iterator<char>{});
        if (fileStream.bad())
            throw std::system_error(errno, std::generic_category(), "Reading certificate " + path.string());

        return contents;
    }

    return std::nullopt;
}

Settings
SettingsProvider::parseSettings() const
{
    auto settings = Settings::defaultSettings();

    // all config values used in settings is under "database.cassandra" prefix
    if (auto const bundle = config_.maybeValue<std::string>("secure_connect_bundle"); bundle.has_value()) {
        settings.connectionInfo = Settings::SecureConnectionBundle{*bundle};
    } else {
        settings.connectionInfo = Settings::ContactPoints{
            .contactPoints = config_.get<std::string>("contact_points"),
            .port = config_.maybeValue<uint16_t>("port")
        };
    }

    settings.threads = config_.get<uint32_t>("threads");
    settings.coreConnectionsPerHost = config_.get<uint32_t>("core_connections_per_host");
    settings.enableLog = config_.get<bool>("driver_log");

    if (auto const connectTimeout = config_.maybeValue<uint32_t>("connect_timeout"); connectTimeout.has_value())
        settings.connectionTimeout = std::chrono::milliseconds{*connectTimeout * 1000};
    if (auto const requestTimeout = config_.maybeValue<uint32_t>("request_timeout"); requestTimeout.has_value())
        settings.requestTimeout = std::chrono::milliseconds{*requestTimeout * 1000};

    settings.certificate = parseOptionalCertificate();
    settings.username = config_.maybeValue<std::string>("username");
    settings.password = config_.maybeValue<std::string>("password");

    return settings;
}

}  // namespace data::cassandra
