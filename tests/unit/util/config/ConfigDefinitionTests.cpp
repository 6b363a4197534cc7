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

#include "util/config/ConfigConstraints.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/config/ConfigFileJson.hpp"
#include "util/config/ConfigValue.hpp"
#include "util/config/ObjectView.hpp"
#include "util/config/Types.hpp"

#include <boost/json/parse.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace util::config;

struct ConfigDefinitionTest : testing::Test {
protected:
    ConfigDefinition config_{
        {"database.cassandra.keyspace", ConfigValue{ConfigType::String}.defaultValue("cassmig")},
        {"database.cassandra.port", ConfigValue{ConfigType::Integer}.withConstraint(gValidatePort).optional()},
        {"migration.agreement_timeout",
         ConfigValue{ConfigType::Integer}.defaultValue(10).withConstraint(gValidatePositiveUint32)},
        {"migration.validate_checksums", ConfigValue{ConfigType::Boolean}.defaultValue(true)},
    };

    static ConfigFileJson
    json(std::string const& text)
    {
        return ConfigFileJson{boost::json::parse(text).as_object()};
    }
};

TEST_F(ConfigDefinitionTest, DefaultsWhenMissing)
{
    ASSERT_FALSE(config_.parse(json("{}")).has_value());

    EXPECT_EQ(config_.get<std::string>("database.cassandra.keyspace"), "cassmig");
    EXPECT_FALSE(config_.maybeValue<uint32_t>("database.cassandra.port").has_value());
    EXPECT_EQ(config_.get<uint32_t>("migration.agreement_timeout"), 10u);
    EXPECT_TRUE(config_.get<bool>("migration.validate_checksums"));
}

TEST_F(ConfigDefinitionTest, NestedObjectsAreFlattened)
{
    auto const errors = config_.parse(json(R"json({
        "database": {"cassandra": {"keyspace": "books", "port": 9142}},
        "migration": {"agreement_timeout": 25, "validate_checksums": false}
    })json"));
    ASSERT_FALSE(errors.has_value());

    auto const migration = config_.getObject("migration");
    EXPECT_EQ(migration.get<uint32_t>("agreement_timeout"), 25u);
    EXPECT_FALSE(migration.get<bool>("validate_checksums"));
    EXPECT_EQ(config_.get<std::string>("database.cassandra.keyspace"), "books");
    EXPECT_EQ(config_.maybeValue<uint32_t>("database.cassandra.port"), 9142u);
}

TEST_F(ConfigDefinitionTest, ConstraintViolationsAreReported)
{
    auto const errors = config_.parse(json(R"json({
        "database": {"cassandra": {"port": 123456}},
        "migration": {"agreement_timeout": 0}
    })json"));
    ASSERT_TRUE(errors.has_value());
    EXPECT_EQ(errors->size(), 2u);
}

TEST(CassmigConfigTest, LockTtlBeyondCassandraLimitIsRejected)
{
    auto& config = getCassmigConfig();

    auto errors = config.parse(ConfigFileJson{boost::json::parse(R"json({"migration": {"lock_ttl": 630720001}})json")
                                                  .as_object()});
    ASSERT_TRUE(errors.has_value());
    ASSERT_EQ(errors->size(), 1u);
    EXPECT_NE(errors->front().error.find("630720000"), std::string::npos);

    errors = config.parse(ConfigFileJson{boost::json::parse(R"json({"migration": {"lock_ttl": 630720000}})json")
                                             .as_object()});
    EXPECT_FALSE(errors.has_value());
    EXPECT_EQ(config.get<uint32_t>("migration.lock_ttl"), kMAX_CASSANDRA_TTL);
}
