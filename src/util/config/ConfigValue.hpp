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
#include "util/config/ConfigConstraints.hpp"
#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace util::config {

/**
 * @brief Represents the config values for Json/Yaml config
 *
 * Used in ConfigDefinition to indicate the required type of value and
 * whether it is mandatory to specify in the configuration
 */
class ConfigValue {
public:
    /**
     * @brief Constructor initializing with the config type
     *
     * @param type The type of the config value
     */
    constexpr ConfigValue(ConfigType type) : type_(type)
    {
    }

    /**
     * @brief Sets the default value for the config
     *
     * @param value The default value
     * @return Reference to this ConfigValue
     */
    [[nodiscard]] ConfigValue&
    defaultValue(Value value)
    {
        value = normalize(type_, std::move(value));
        auto const err = checkTypeConsistency(type_, value);
        ASSERT(!err.has_value(), "{}", err.has_value() ? err->error : "");
        value_ = std::move(value);
        return *this;
    }

    /**
     * @brief Sets the value for the config, checking type and constraint
     *
     * @param value The value to set
     * @param key The config key of the value, prepended to the error message if any
     * @return An optional Error if the value is of the wrong type or violates the constraint
     */
    [[nodiscard]] std::optional<Error>
    setValue(Value value, std::optional<std::string_view> key = std::nullopt)
    {
        value = normalize(type_, std::move(value));
        auto err = checkTypeConsistency(type_, value);
        if (not err.has_value() and cons_.has_value())
            err = cons_->get().checkConstraint(value);

        if (err.has_value()) {
            if (key.has_value())
                err->error = fmt::format("{} {}", key.value(), err->error);
            return err;
        }

        value_ = std::move(value);
        return std::nullopt;
    }

    /**
     * @brief Assigns a constraint to the ConfigValue.
     *
     * The constraint is checked against the default value, if any, right away.
     *
     * @param cons The constraint to assign
     * @return Reference to this ConfigValue
     */
    [[nodiscard]] ConfigValue&
    withConstraint(Constraint const& cons)
    {
        cons_ = std::reference_wrapper<Constraint const>(cons);
        if (value_.has_value()) {
            auto const err = cons_->get().checkConstraint(*value_);
            ASSERT(!err.has_value(), "Default value does not satisfy the constraint: {}", err.has_value() ? err->error : "");
        }
        return *this;
    }

    /**
     * @brief Retrieves the constraint assigned to the ConfigValue, if any
     *
     * @return The constraint or std::nullopt
     */
    [[nodiscard]] std::optional<std::reference_wrapper<Constraint const>>
    getConstraint() const
    {
        return cons_;
    }

    /**
     * @brief Gets the config type
     *
     * @return The config type
     */
    [[nodiscard]] constexpr ConfigType
    type() const
    {
        return type_;
    }

    /**
     * @brief Sets the config value as optional, meaning the user doesn't have to provide the value in their config
     *
     * @return Reference to this ConfigValue
     */
    [[nodiscard]] ConfigValue&
    optional()
    {
        optional_ = true;
        return *this;
    }

    /**
     * @brief Checks if configValue is optional
     *
     * @return true if optional, false otherwise
     */
    [[nodiscard]] bool
    isOptional() const
    {
        return optional_;
    }

    /**
     * @brief Check if value is set
     *
     * @return true if a default or user-provided value is present
     */
    [[nodiscard]] bool
    hasValue() const
    {
        return value_.has_value();
    }

    /**
     * @brief Get the value of config
     *
     * @return Config Value
     */
    [[nodiscard]] Value const&
    getValue() const
    {
        ASSERT(value_.has_value(), "getValue() is called on a ConfigValue without a value");
        return value_.value();
    }

private:
    static Value
    normalize(ConfigType type, Value value)
    {
        // integers are accepted where a double is expected
        if (type == ConfigType::Double and std::holds_alternative<int64_t>(value))
            return static_cast<double>(std::get<int64_t>(value));
        return value;
    }

    static std::optional<Error>
    checkTypeConsistency(ConfigType type, Value const& value)
    {
        if (type == ConfigType::String && !std::holds_alternative<std::string>(value))
            return Error{"value does not match type string"};
        if (type == ConfigType::Boolean && !std::holds_alternative<bool>(value))
            return Error{"value does not match type boolean"};
        if (type == ConfigType::Double && !std::holds_alternative<double>(value))
            return Error{"value does not match type double"};
        if (type == ConfigType::Integer && !std::holds_alternative<int64_t>(value))
            return Error{"value does not match type integer"};
        return std::nullopt;
    }

    ConfigType type_{};
    bool optional_{false};
    std::optional<Value> value_;
    std::optional<std::reference_wrapper<Constraint const>> cons_;
};

}  // namespace util::config
