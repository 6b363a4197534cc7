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

#include "util/config/ConfigFileJson.hpp"

#include "util/Assert.hpp"
#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <boost/filesystem/path.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/parse_options.hpp>
#include <boost/json/value.hpp>
#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <fstream>
#include <ios>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace util::config {

namespace {

/**
 * @brief Extracts the value from a JSON object and converts it into the corresponding type.
 *
 * @param jsonValue The JSON value to extract.
 * @return A variant containing the same type corresponding to the extracted value.
 */
[[nodiscard]] Value
extractJsonValue(boost::json::value const& jsonValue)
{
    if (jsonValue.is_int64())
        return jsonValue.as_int64();
    if (jsonValue.is_uint64())
        return static_cast<int64_t>(jsonValue.as_uint64());
    if (jsonValue.is_string())
        return std::string{jsonValue.as_string().c_str()};
    if (jsonValue.is_bool())
        return jsonValue.as_bool();
    if (jsonValue.is_double())
        return jsonValue.as_double();
    ASSERT(false, "Json is not of type int, uint, string, bool or double");
    std::unreachable();
}

void
appendAt(boost::json::object& target, std::string const& key, boost::json::value const& value, std::size_t index)
{
    auto& slot = target[key];
    if (not slot.is_array())
        slot = boost::json::array{};

    auto& array = slot.as_array();
    while (array.size() < index)
        array.emplace_back(nullptr);
    array.push_back(value);
}

}  // namespace

ConfigFileJson::ConfigFileJson(boost::json::object jsonObj)
{
    flattenJson(jsonObj, "");
}

std::expected<ConfigFileJson, Error>
ConfigFileJson::makeConfigFileJson(std::string_view configFilePath)
{
    try {
        std::ifstream const in(std::string{configFilePath}, std::ios::in | std::ios::binary);
        if (!in)
            return std::unexpected<Error>(Error{fmt::format("Could not open configuration file '{}'", configFilePath)});

        std::stringstream contents;
        contents << in.rdbuf();

        auto opts = boost::json::parse_options{};
        opts.allow_comments = true;
        auto const tempObj = boost::json::parse(contents.str(), {}, opts);
        if (not tempObj.is_object())
            return std::unexpected<Error>(Error{"Configuration file must contain a json object"});

        return ConfigFileJson{tempObj.as_object()};
    } catch (std::exception const& e) {
        return std::unexpected<Error>(
            Error{fmt::format("An error occurred while processing configuration file '{}': {}", configFilePath, e.what())}
        );
    }
}

Value
ConfigFileJson::getValue(std::string_view key) const
{
    ASSERT(jsonObject_.contains(key), "Key {} does not exist in the json config", key);
    return extractJsonValue(jsonObject_.at(key));
}

std::vector<std::optional<Value>>
ConfigFileJson::getArray(std::string_view key) const
{
    ASSERT(jsonObject_.contains(key) and jsonObject_.at(key).is_array(), "Key {} is not an array", key);

    std::vector<std::optional<Value>> configValues;
    for (auto const& item : jsonObject_.at(key).as_array()) {
        if (item.is_null()) {
            configValues.emplace_back(std::nullopt);
        } else {
            configValues.emplace_back(extractJsonValue(item));
        }
    }
    return configValues;
}

bool
ConfigFileJson::containsKey(std::string_view key) const
{
    return jsonObject_.contains(key);
}

void
ConfigFileJson::flattenJson(boost::json::object const& jsonRootObject, std::string const& prefix)
{
    for (auto const& [key, value] : jsonRootObject) {
        auto const name = std::string_view(key.data(), key.size());
        auto const fullKey = prefix.empty() ? std::string{name} : fmt::format("{}.{}", prefix, name);

        if (value.is_object()) {
            flattenJson(value.as_object(), fullKey);
        } else if (value.is_array()) {
            flattenArray(value.as_array(), fullKey + ".[]");
        } else {
            jsonObject_[fullKey] = value;
        }
    }
}

void
ConfigFileJson::flattenArray(boost::json::array const& array, std::string const& arrayKey)
{
    std::vector<std::string> touchedKeys;

    for (std::size_t idx = 0; idx < array.size(); ++idx) {
        auto const& element = array[idx];
        if (not element.is_object()) {
            appendAt(jsonObject_, arrayKey, element, idx);
            touchedKeys.push_back(arrayKey);
            continue;
        }

        // flatten the element on its own, then spread every field into its own array
        ConfigFileJson const flatElement{element.as_object()};
        for (auto const& [field, fieldValue] : flatElement.jsonObject_) {
            auto const key = fmt::format("{}.{}", arrayKey, std::string_view(field.data(), field.size()));
            appendAt(jsonObject_, key, fieldValue, idx);
            touchedKeys.push_back(key);
        }
    }

    // elements which leave a field out are padded so every field array has the same length
    for (auto const& key : touchedKeys) {
        auto& fieldArray = jsonObject_[key].as_array();
        while (fieldArray.size() < array.size())
            fieldArray.emplace_back(nullptr);
    }

    if (array.empty())
        jsonObject_[arrayKey] = boost::json::array{};
}

}  // namespace util::config
