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

#include "app/VerifyConfig.hpp"
#include "util/TmpFile.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/config/ConfigValue.hpp"
#include "util/config/Types.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

using namespace app;
using namespace util::config;

namespace {

ConfigDefinition
makeMigrationSettings(
    int64_t lockTtl,
    int64_t agreementTimeout,
    int64_t pollInterval,
    std::optional<std::string> username = std::nullopt,
    std::optional<std::string> password = std::nullopt
)
{
    auto credential = [](std::optional<std::string> value) {
        auto entry = ConfigValue{ConfigType::String}.optional();
        if (value.has_value())
            return entry.defaultValue(std::move(*value));
        return entry;
    };

    return ConfigDefinition{
        {"migration.lock_ttl", ConfigValue{ConfigType::Integer}.defaultValue(lockTtl)},
        {"migration.agreement_timeout", ConfigValue{ConfigType::Integer}.defaultValue(agreementTimeout)},
        {"migration.agreement_poll_interval", ConfigValue{ConfigType::Integer}.defaultValue(pollInterval)},
        {"database.cassandra.username", credential(std::move(username))},
        {"database.cassandra.password", credential(std::move(password))},
    };
}

}  // namespace

TEST(VerifyConfigTest, InvalidConfig)
{
    static constexpr auto kINVALID_VALUES = R"JSON({
        "database": {
            "cassandra": {
                "contact_points": "127.0.0.1",
                "port": 70000
            }
        },
        "migration": {
            "agreement_timeout": 0
        },
        "log_level": "verbose"
    })JSON";
    auto const tmpConfigFile = TmpFile(kINVALID_VALUES);

    EXPECT_FALSE(parseConfig(tmpConfigFile.path));
}

TEST(VerifyConfigTest, WrongValueType)
{
    static constexpr auto kWRONG_TYPE = R"JSON({
        "migration": {
            "validate_checksums": "yes"
        }
    })JSON";
    auto const tmpConfigFile = TmpFile(kWRONG_TYPE);

    EXPECT_FALSE(parseConfig(tmpConfigFile.path));
}

TEST(VerifyConfigTest, ValidConfig)
{
    static constexpr auto kVALID_JSON_DATA = R"JSON({
        "database": {
            "cassandra": {
                "contact_points": "127.0.0.1",
                "port": 9042,
                "keyspace": "books",
                "replication_factor": 1
            }
        },
        "migration": {
            "scripts_directory": "/var/lib/cassmig/scripts",
            "agreement_timeout": 30,
            "agreement_poll_interval": 200,
            "lock_ttl": 120
        },
        "log_level": "debug",
        "log_to_console": false
    })JSON";
    auto const tmpConfigFile = TmpFile(kVALID_JSON_DATA);

    EXPECT_TRUE(parseConfig(tmpConfigFile.path));
}

TEST(VerifyConfigTest, EmptyConfigUsesDefaults)
{
    auto const tmpConfigFile = TmpFile("{}");
    EXPECT_TRUE(parseConfig(tmpConfigFile.path));
}

TEST(VerifyConfigTest, ConfigFileNotExist)
{
    EXPECT_FALSE(parseConfig("doesn't exist Config File"));
}

TEST(VerifyConfigTest, InvalidJsonFile)
{
    // invalid json because extra "," after 9042
    static constexpr auto kINVALID_JSON = R"({
                                             "database": {
                                                "cassandra": {
                                                    "port": 9042,
                                                }
                                             }
                                        })";
    auto const tmpConfigFile = TmpFile(kINVALID_JSON);

    EXPECT_FALSE(parseConfig(tmpConfigFile.path));
}

TEST(VerifyConfigTest, ConsistentMigrationSettings)
{
    EXPECT_TRUE(checkMigrationSettings(makeMigrationSettings(300, 10, 200)).empty());
    EXPECT_TRUE(checkMigrationSettings(makeMigrationSettings(300, 10, 200, "cassmig", "secret")).empty());
}

TEST(VerifyConfigTest, LeaseShorterThanAgreementWait)
{
    auto const problems = checkMigrationSettings(makeMigrationSettings(30, 30, 200));
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_EQ(problems.front(), "migration.lock_ttl (30s) must be greater than migration.agreement_timeout (30s)");
}

TEST(VerifyConfigTest, PollIntervalLongerThanAgreementWait)
{
    auto const problems = checkMigrationSettings(makeMigrationSettings(300, 2, 2000));
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_EQ(
        problems.front(),
        "migration.agreement_poll_interval (2000ms) must be shorter than migration.agreement_timeout (2s)"
    );
}

TEST(VerifyConfigTest, UsernameWithoutPassword)
{
    auto const problems = checkMigrationSettings(makeMigrationSettings(300, 10, 200, "cassmig"));
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_EQ(problems.front(), "database.cassandra.username and database.cassandra.password must be set together");
}

TEST(VerifyConfigTest, LeaseTooShortInConfigFile)
{
    static constexpr auto kSHORT_LEASE = R"JSON({
        "migration": {
            "agreement_timeout": 60,
            "agreement_poll_interval": 200,
            "lock_ttl": 60
        }
    })JSON";
    auto const tmpConfigFile = TmpFile(kSHORT_LEASE);

    EXPECT_FALSE(parseConfig(tmpConfigFile.path));
}
