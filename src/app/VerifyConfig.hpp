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

#include "util/config/ConfigDefinition.hpp"
#include "util/config/ConfigFileJson.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace app {

/**
 * @brief Checks the relations between settings that a constraint on a single key can't express
 *
 * @param config A parsed config definition
 * @return One message per broken rule, empty if the settings fit together
 */
inline std::vector<std::string>
checkMigrationSettings(util::config::ConfigDefinition const& config)
{
    std::vector<std::string> problems;

    auto const lockTtl = config.get<uint32_t>("migration.lock_ttl");
    auto const agreementTimeout = config.get<uint32_t>("migration.agreement_timeout");

    // the lease is renewed between scripts only, so it must outlive a whole agreement wait
    if (lockTtl <= agreementTimeout) {
        problems.push_back(fmt::format(
            "migration.lock_ttl ({}s) must be greater than migration.agreement_timeout ({}s)", lockTtl, agreementTimeout
        ));
    }

    auto const pollInterval = config.get<uint32_t>("migration.agreement_poll_interval");
    if (pollInterval >= static_cast<uint64_t>(agreementTimeout) * 1000u) {
        problems.push_back(fmt::format(
            "migration.agreement_poll_interval ({}ms) must be shorter than migration.agreement_timeout ({}s)",
            pollInterval,
            agreementTimeout
        ));
    }

    auto const hasUsername = config.maybeValue<std::string>("database.cassandra.username").has_value();
    auto const hasPassword = config.maybeValue<std::string>("database.cassandra.password").has_value();
    if (hasUsername != hasPassword)
        problems.emplace_back("database.cassandra.username and database.cassandra.password must be set together");

    return problems;
}

/**
 * @brief Loads the user's config into the global config definition and checks that its migration settings are usable
 *
 * Every problem found is printed to stderr.
 *
 * @param configPath The path to config
 * @return true if the config can be used for a migration run, false otherwise
 */
inline bool
parseConfig(std::string_view configPath)
{
    using namespace util::config;

    auto const json = ConfigFileJson::makeConfigFileJson(configPath);
    if (!json.has_value()) {
        std::cerr << json.error().error << std::endl;
        return false;
    }
    if (auto const errors = getCassmigConfig().parse(json.value()); errors.has_value()) {
        for (auto const& err : errors.value())
            std::cerr << err.error << std::endl;
        return false;
    }

    auto const problems = checkMigrationSettings(getCassmigConfig());
    for (auto const& problem : problems)
        std::cerr << problem << std::endl;
    return problems.empty();
}

}  // namespace app
