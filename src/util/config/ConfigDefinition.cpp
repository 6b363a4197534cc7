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

#include "util/config/ConfigDefinition.hpp"

#include "util/Assert.hpp"
#include "util/config/Array.hpp"
#include "util/config/ArrayView.hpp"
#include "util/config/ConfigConstraints.hpp"
#include "util/config/ConfigFileInterface.hpp"
#include "util/config/ConfigValue.hpp"
#include "util/config/Error.hpp"
#include "util/config/ObjectView.hpp"
#include "util/config/Types.hpp"
#include "util/config/ValueView.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

namespace util::config {

ConfigDefinition::ConfigDefinition(std::initializer_list<KeyValuePair> pair)
{
    for (auto const& [key, value] : pair) {
        if (key.contains("[]"))
            ASSERT(std::holds_alternative<Array>(value), "Value of key {} must be an Array", key);
        map_.emplace(std::string{key}, value);
    }
}

std::optional<std::vector<Error>>
ConfigDefinition::parse(ConfigFileInterface const& config)
{
    std::vector<Error> listOfErrors;

    for (auto& [key, value] : map_) {
        if (not config.containsKey(key)) {
            if (auto const* configValue = std::get_if<ConfigValue>(&value);
                configValue != nullptr and not configValue->hasValue() and not configValue->isOptional()) {
                listOfErrors.emplace_back(key, "key is required in user Config");
            }
            continue;
        }

        std::visit(
            [&](auto& entry) {
                using EntryType = std::decay_t<decltype(entry)>;
                if constexpr (std::is_same_v<EntryType, ConfigValue>) {
                    if (auto const err = entry.setValue(config.getValue(key), key); err.has_value())
                        listOfErrors.push_back(*err);
                } else {
                    for (auto const& element : config.getArray(key)) {
                        auto const err = element.has_value() ? entry.addValue(*element, key) : entry.addPattern();
                        if (err.has_value())
                            listOfErrors.emplace_back(key, err->error);
                    }
                }
            },
            value
        );
    }

    if (listOfErrors.empty())
        return std::nullopt;
    return listOfErrors;
}

ObjectView
ConfigDefinition::getObject(std::string_view prefix) const
{
    return ObjectView{prefix, *this};
}

ArrayView
ConfigDefinition::getArray(std::string_view prefix) const
{
    return ArrayView{prefix, *this};
}

bool
ConfigDefinition::contains(std::string_view key) const
{
    return map_.contains(key);
}

bool
ConfigDefinition::hasItemsWithPrefix(std::string_view key) const
{
    return std::ranges::any_of(map_, [&key](auto const& pair) { return pair.first.starts_with(key); });
}

ValueView
ConfigDefinition::getValueView(std::string_view fullKey) const
{
    auto const it = map_.find(fullKey);
    ASSERT(it != map_.end(), "Key {} doesn't exist in config", fullKey);
    ASSERT(std::holds_alternative<ConfigValue>(it->second), "Key {} is an array, not a value", fullKey);
    return ValueView{std::get<ConfigValue>(it->second)};
}

ValueView
ConfigDefinition::getValueInArray(std::string_view fullKey, std::size_t index) const
{
    return ValueView{asArray(fullKey).at(index)};
}

std::size_t
ConfigDefinition::arraySize(std::string_view arrayPrefix) const
{
    if (contains(arrayPrefix))
        return asArray(arrayPrefix).size();

    auto const fieldPrefix = fmt::format("{}.", arrayPrefix);
    auto const it = std::ranges::find_if(map_, [&fieldPrefix](auto const& pair) {
        return pair.first.starts_with(fieldPrefix) and std::holds_alternative<Array>(pair.second);
    });
    if (it == map_.end())
        return 0;
    return std::get<Array>(it->second).size();
}

Array const&
ConfigDefinition::asArray(std::string_view key) const
{
    auto const it = map_.find(key);
    ASSERT(it != map_.end(), "Key {} doesn't exist in config", key);
    ASSERT(std::holds_alternative<Array>(it->second), "Key {} is not an Array", key);
    return std::get<Array>(it->second);
}

ConfigDefinition&
getCassmigConfig()
{
    static ConfigDefinition gCassmigConfig{
        {"database.cassandra.contact_points", ConfigValue{ConfigType::String}.defaultValue("localhost")},
        {"database.cassandra.secure_connect_bundle", ConfigValue{ConfigType::String}.optional()},
        {"database.cassandra.port", ConfigValue{ConfigType::Integer}.withConstraint(gValidatePort).optional()},
        {"database.cassandra.keyspace", ConfigValue{ConfigType::String}.defaultValue("cassmig")},
        {"database.cassandra.replication_factor",
         ConfigValue{ConfigType::Integer}.defaultValue(3u).withConstraint(gValidateUint16)},
        {"database.cassandra.table_prefix", ConfigValue{ConfigType::String}.optional()},
        {"database.cassandra.threads",
         ConfigValue{ConfigType::Integer}
             .defaultValue(static_cast<uint32_t>(std::thread::hardware_concurrency()))
             .withConstraint(gValidateUint32)},
        {"database.cassandra.core_connections_per_host",
         ConfigValue{ConfigType::Integer}.defaultValue(1).withConstraint(gValidateUint16)},
        {"database.cassandra.connect_timeout",
         ConfigValue{ConfigType::Integer}.optional().withConstraint(gValidateUint32)},
        {"database.cassandra.request_timeout",
         ConfigValue{ConfigType::Integer}.optional().withConstraint(gValidateUint32)},
        {"database.cassandra.username", ConfigValue{ConfigType::String}.optional()},
        {"database.cassandra.password", ConfigValue{ConfigType::String}.optional()},
        {"database.cassandra.certfile", ConfigValue{ConfigType::String}.optional()},
        {"database.cassandra.driver_log", ConfigValue{ConfigType::Boolean}.defaultValue(false)},

        {"migration.tracking_table", ConfigValue{ConfigType::String}.defaultValue("schema_migrations")},
        {"migration.scripts_directory", ConfigValue{ConfigType::String}.optional()},
        {"migration.bootstrap_tracking_table", ConfigValue{ConfigType::Boolean}.defaultValue(true)},
        {"migration.agreement_timeout",
         ConfigValue{ConfigType::Integer}.defaultValue(10).withConstraint(gValidatePositiveUint32)},
        {"migration.agreement_poll_interval",
         ConfigValue{ConfigType::Integer}.defaultValue(200).withConstraint(gValidatePositiveUint32)},
        {"migration.lock_timeout",
         ConfigValue{ConfigType::Integer}.defaultValue(60).withConstraint(gValidateUint32)},
        {"migration.lock_ttl",
         ConfigValue{ConfigType::Integer}.defaultValue(300).withConstraint(gValidateTtl)},
        {"migration.lock_poll_interval",
         ConfigValue{ConfigType::Integer}.defaultValue(1000).withConstraint(gValidatePositiveUint32)},
        {"migration.run_timeout", ConfigValue{ConfigType::Integer}.optional().withConstraint(gValidateUint32)},
        {"migration.validate_checksums", ConfigValue{ConfigType::Boolean}.defaultValue(true)},

        {"log_channels.[].channel", Array{ConfigValue{ConfigType::String}.withConstraint(gValidateChannelName)}},
        {"log_channels.[].log_level", Array{ConfigValue{ConfigType::String}.withConstraint(gValidateLogLevelName)}},
        {"log_level", ConfigValue{ConfigType::String}.defaultValue("info").withConstraint(gValidateLogLevelName)},
        {"log_format",
         ConfigValue{ConfigType::String}.defaultValue(
             R"(%TimeStamp% (%SourceLocation%) [%ThreadID%] %Channel%:%Severity% %Message%)"
         )},
        {"log_to_console", ConfigValue{ConfigType::Boolean}.defaultValue(true)},
        {"log_directory", ConfigValue{ConfigType::String}.optional()},
        {"log_rotation_size", ConfigValue{ConfigType::Integer}.defaultValue(2048).withConstraint(gValidateUint32)},
        {"log_directory_max_size",
         ConfigValue{ConfigType::Integer}.defaultValue(50 * 1024).withConstraint(gValidateUint32)},
        {"log_rotation_hour_interval",
         ConfigValue{ConfigType::Integer}.defaultValue(12).withConstraint(gValidateUint32)},
    };
    return gCassmigConfig;
}

}  // namespace util::config
