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

#include "util/Assert.hpp"
#include "util/config/Array.hpp"
#include "util/config/ArrayView.hpp"
#include "util/config/ConfigFileInterface.hpp"
#include "util/config/ConfigValue.hpp"
#include "util/config/Error.hpp"
#include "util/config/ObjectView.hpp"
#include "util/config/ValueView.hpp"

#include <cstddef>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace util::config {

/**
 * @brief All the config data will be stored and extracted from this class
 *
 * Represents all the possible config data. Keys of array elements contain `.[]`, e.g. `log_channels.[].channel`.
 */
class ConfigDefinition {
public:
    /** @brief member types */
    using KeyValuePair = std::pair<std::string_view, std::variant<ConfigValue, Array>>;

    /**
     * @brief Constructs a new ConfigDefinition
     *
     * Initializes the configuration with a predefined set of key-value pairs
     * If a key contains "[]", the corresponding value must be an Array
     *
     * @param pair A list of key-value pairs for the predefined set of config values
     */
    ConfigDefinition(std::initializer_list<KeyValuePair> pair);

    /**
     * @brief Parses the configuration file
     *
     * Also checks that no extra configuration key/value pairs are present. Adds to list of Errors
     * if it does
     *
     * @param config The configuration file interface
     * @return An optional vector of Error objects stating all the failures if parsing fails
     */
    [[nodiscard]] std::optional<std::vector<Error>>
    parse(ConfigFileInterface const& config);

    /**
     * @brief Returns the ObjectView specified with the prefix
     *
     * @param prefix The key prefix for the ObjectView
     * @return ObjectView with the given prefix
     */
    [[nodiscard]] ObjectView
    getObject(std::string_view prefix) const;

    /**
     * @brief Returns the specified ArrayView for the given key
     *
     * @param prefix The key of the array, without `.[]`
     * @return ArrayView for the given key
     */
    [[nodiscard]] ArrayView
    getArray(std::string_view prefix) const;

    /**
     * @brief Checks if a key is present in the configuration map.
     *
     * @param key The key to search for in the configuration map.
     * @return True if the key is present, false otherwise.
     */
    [[nodiscard]] bool
    contains(std::string_view key) const;

    /**
     * @brief Checks if any key in config starts with "key"
     *
     * @param key The key to search for in the configuration map.
     * @return True if the any key in config starts with "key", false otherwise.
     */
    [[nodiscard]] bool
    hasItemsWithPrefix(std::string_view key) const;

    /**
     * @brief Returns the ValueView of the given full key
     *
     * @param fullKey The config key to search for
     * @return ValueView associated with the given key
     */
    [[nodiscard]] ValueView
    getValueView(std::string_view fullKey) const;

    /**
     * @brief Returns the ValueView of an element of an array
     *
     * @param fullKey The config key of the array, e.g. `log_channels.[].channel`
     * @param index The index of the element
     * @return ValueView of the element
     */
    [[nodiscard]] ValueView
    getValueInArray(std::string_view fullKey, std::size_t index) const;

    /**
     * @brief Returns the number of elements of an array
     *
     * @param arrayPrefix The key of the array ending with `.[]`
     * @return The size of the array
     */
    [[nodiscard]] std::size_t
    arraySize(std::string_view arrayPrefix) const;

    /**
     * @brief Returns the Array object associated with the specified key.
     *
     * @param key The key whose associated Array object is to be returned.
     * @return The Array object associated with the specified key.
     */
    [[nodiscard]] Array const&
    asArray(std::string_view key) const;

    /**
     * @brief Returns the specified value of given string
     *
     * @tparam T The type T to return
     * @param fullKey The config key to search for
     * @return The value of the requested type
     */
    template <typename T>
    [[nodiscard]] T
    get(std::string_view fullKey) const
    {
        return getValueView(fullKey).getValue<T>();
    }

    /**
     * @brief Returns the specified value of given string if value exists
     *
     * @tparam T The type T to return
     * @param fullKey The config key to search for
     * @return The value if set, std::nullopt otherwise
     */
    template <typename T>
    [[nodiscard]] std::optional<T>
    maybeValue(std::string_view fullKey) const
    {
        return getValueView(fullKey).asOptional<T>();
    }

    /**
     * @brief Returns the number of keys in the definition
     *
     * @return Number of keys
     */
    [[nodiscard]] std::size_t
    size() const
    {
        return map_.size();
    }

    /**
     * @brief Returns the iterator of key-value pairs stored in the definition
     *
     * @return Constant iterator to the beginning of the map
     */
    [[nodiscard]] auto
    begin() const
    {
        return map_.begin();
    }

    /**
     * @brief Returns the end iterator of key-value pairs stored in the definition
     *
     * @return Constant iterator to the end of the map
     */
    [[nodiscard]] auto
    end() const
    {
        return map_.end();
    }

private:
    std::map<std::string, std::variant<ConfigValue, Array>, std::less<>> map_;
};

/**
 * @brief The full configuration definition of cassmig. Values are filled in by parsing the user's config file.
 *
 * @return The process-wide configuration definition
 */
ConfigDefinition&
getCassmigConfig();

}  // namespace util::config
