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

#include "util/config/ValueView.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace util::config {

class ConfigDefinition;
class ArrayView;

/**
 * @brief Provides a view into a subset of configuration data defined by a prefix
 *
 * Allows querying and accessing configuration values based on the provided prefix
 */
class ObjectView {
public:
    /**
     * @brief Constructs an ObjectView for the specified prefix. The view must be of type object
     *
     * @param prefix The prefix indicating the subset of configuration data to view
     * @param configDef The configuration definition the view is created from
     */
    ObjectView(std::string_view prefix, ConfigDefinition const& configDef);

    /**
     * @brief Constructs an ObjectView for an indexed array within the specified prefix
     *
     * @param prefix The prefix of the array, ending with `.[]`
     * @param arrayIndex The index of the object within the array
     * @param configDef The configuration definition the view is created from
     */
    ObjectView(std::string_view prefix, std::size_t arrayIndex, ConfigDefinition const& configDef);

    /**
     * @brief Checks if prefix_.key (fullkey) exists in ConfigDefinition
     *
     * @param key The suffix of the key
     * @return true if the full key exists, otherwise false
     */
    [[nodiscard]] bool
    containsKey(std::string_view key) const;

    /**
     * @brief Retrieves the value associated with the specified prefix._key in ConfigDefinition
     *
     * @param key The suffix of the key
     * @return A ValueView object representing the value associated with the key
     */
    [[nodiscard]] ValueView
    getValueView(std::string_view key) const;

    /**
     * @brief Returns the specified value of given string if value exists
     *
     * @tparam T The type T to return
     * @param key The config key to search for
     * @return The value of the requested type
     */
    template <typename T>
    [[nodiscard]] T
    get(std::string_view key) const
    {
        return getValueView(key).getValue<T>();
    }

    /**
     * @brief Returns the specified value of given string if value exists, std::nullopt otherwise
     *
     * @tparam T The type T to return
     * @param key The config key to search for
     * @return The value if present, std::nullopt otherwise
     */
    template <typename T>
    [[nodiscard]] std::optional<T>
    maybeValue(std::string_view key) const
    {
        return getValueView(key).asOptional<T>();
    }

    /**
     * @brief Retrieves an ObjectView in ConfigDefinition with key that starts with prefix_.key
     *
     * @param key The suffix of the key
     * @return An ObjectView representing the subset of configuration data
     */
    [[nodiscard]] ObjectView
    getObject(std::string_view key) const;

    /**
     * @brief Retrieves an ArrayView in ConfigDefinition with key that starts with prefix_.key
     *
     * @param key The suffix of the key
     * @return An ArrayView representing the array
     */
    [[nodiscard]] ArrayView
    getArray(std::string_view key) const;

private:
    [[nodiscard]] std::string
    getFullKey(std::string_view key) const;

    std::string prefix_;
    std::optional<std::size_t> arrayIndex_;
    std::reference_wrapper<ConfigDefinition const> configDef_;
};

}  // namespace util::config
