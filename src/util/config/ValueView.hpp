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
#include "util/config/ConfigValue.hpp"
#include "util/config/Types.hpp"

#include <concepts>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace util::config {

/**
 * @brief Provides view into ConfigValues that represents values in Clio Config
 */
class ValueView {
public:
    /**
     * @brief Constructs a ValueView object
     *
     * @param configVal the config Value to view
     */
    ValueView(ConfigValue const& configVal);

    /**
     * @brief Retrieves the value as a string
     *
     * @return The value as a string
     * @throws std::bad_variant_access if the value is not a string
     */
    [[nodiscard]] std::string_view
    asString() const;

    /**
     * @brief Retrieves the value as a boolean
     *
     * @return The value as a boolean
     * @throws std::bad_variant_access if the value is not a boolean
     */
    [[nodiscard]] bool
    asBool() const;

    /**
     * @brief Retrieves any type of "int" value (uint_32, int64_t etc)
     *
     * @tparam T The integral type to convert to
     * @return The value converted to T
     */
    template <std::integral T>
    [[nodiscard]] T
    asIntType() const
    {
        ASSERT(type() == ConfigType::Integer, "Value is not of integer type");
        auto const val = std::get<int64_t>(configVal_.get().getValue());
        ASSERT(std::in_range<T>(val), "Value {} does not fit the requested integer type", val);
        return static_cast<T>(val);
    }

    /**
     * @brief Retrieves the value as a double
     *
     * @return The value as a double
     */
    [[nodiscard]] double
    asDouble() const;

    /**
     * @brief Retrieves the value converted to the requested type
     *
     * @tparam T The type to convert to
     * @return The value
     */
    template <typename T>
    [[nodiscard]] T
    getValue() const
    {
        if constexpr (std::is_same_v<T, bool>) {
            return asBool();
        } else if constexpr (std::is_integral_v<T>) {
            return asIntType<T>();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return std::string{asString()};
        } else {
            static_assert(std::is_floating_point_v<T>, "Unsupported type for config value");
            return static_cast<T>(asDouble());
        }
    }

    /**
     * @brief Returns an optional value of the requested type
     *
     * @tparam T The type to convert to
     * @return The value, or std::nullopt if the value is not set
     */
    template <typename T>
    [[nodiscard]] std::optional<T>
    asOptional() const
    {
        if (!hasValue())
            return std::nullopt;
        return getValue<T>();
    }

    /**
     * @brief Gets the config type
     *
     * @return The config type
     */
    [[nodiscard]] ConfigType
    type() const
    {
        return configVal_.get().type();
    }

    /**
     * @brief Check if Config Value exists
     *
     * @return true if exists, false otherwise
     */
    [[nodiscard]] bool
    hasValue() const
    {
        return configVal_.get().hasValue();
    }

    /**
     * @brief Check if config value is optional
     *
     * @return true if optional, false otherwise
     */
    [[nodiscard]] bool
    isOptional() const
    {
        return configVal_.get().isOptional();
    }

private:
    std::reference_wrapper<ConfigValue const> configVal_;
};

}  // namespace util::config
