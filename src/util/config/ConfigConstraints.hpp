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

#include "util/config/Error.hpp"
#include "util/config/Types.hpp"
#include "util/log/Logger.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string_view>
#include <variant>

namespace util::config {

/** @brief Log levels accepted by the logging configuration */
static constexpr std::array<std::string_view, 7> kLOG_LEVEL_NAMES = {
    "trace",
    "debug",
    "info",
    "warning",
    "warn",
    "error",
    "fatal",
};

/** @brief Names of the log channels that can be configured */
static constexpr auto kCHANNEL_NAMES = [] {
    std::array<std::string_view, Logger::kCHANNELS.size()> names{};
    std::ranges::copy(Logger::kCHANNELS, names.begin());
    return names;
}();

/**
 * @brief An interface to enforce constraints on certain values within ConfigDefinition.
 */
class Constraint {
public:
    constexpr virtual ~Constraint() noexcept = default;

    /**
     * @brief Check if the value meets the specific constraint.
     *
     * @param val The value to be checked
     * @return An Error object if the constraint is not met, nullopt otherwise
     */
    [[nodiscard]]
    std::optional<Error>
    checkConstraint(Value const& val) const
    {
        if (auto const maybeError = checkTypeImpl(val); maybeError.has_value())
            return maybeError;
        return checkValueImpl(val);
    }

protected:
    /**
     * @brief Check if the value is of a correct type for the constraint.
     *
     * @param val The value type to be checked
     * @return An Error object if the constraint is not met, nullopt otherwise
     */
    virtual std::optional<Error>
    checkTypeImpl(Value const& val) const = 0;

    /**
     * @brief Check if the value is within the constraint.
     *
     * @param val The value type to be checked
     * @return An Error object if the constraint is not met, nullopt otherwise
     */
    virtual std::optional<Error>
    checkValueImpl(Value const& val) const = 0;
};

/**
 * @brief A constraint to ensure the port number is within a valid range.
 */
class PortConstraint final : public Constraint {
public:
    constexpr ~PortConstraint() noexcept override = default;

private:
    [[nodiscard]] std::optional<Error>
    checkTypeImpl(Value const& port) const override;

    [[nodiscard]] std::optional<Error>
    checkValueImpl(Value const& port) const override;

    static constexpr std::int64_t kPORT_MIN = 1;
    static constexpr std::int64_t kPORT_MAX = 65535;
};

/**
 * @brief A constraint class to ensure the provided value is one of the specified values in an array.
 */
class OneOf final : public Constraint {
public:
    /**
     * @brief Constructs a constraint where the value must be one of the values in the provided array.
     *
     * @param key The key of the ConfigValue that has this constraint
     * @param arr The value that has this constraint must be of the values in arr
     */
    constexpr OneOf(std::string_view key, std::span<std::string_view const> arr) : key_{key}, arr_{arr}
    {
    }

    constexpr ~OneOf() noexcept override = default;

private:
    [[nodiscard]] std::optional<Error>
    checkTypeImpl(Value const& val) const override;

    [[nodiscard]] std::optional<Error>
    checkValueImpl(Value const& val) const override;

    std::string_view key_;
    std::span<std::string_view const> arr_;
};

/**
 * @brief A constraint class to ensure an integer value is between two numbers (inclusive)
 *
 * @tparam NumType The integral type of the bounds
 */
template <typename NumType>
class NumberValueConstraint final : public Constraint {
public:
    /**
     * @brief Constructs a constraint where the number must be between min_ and max_.
     *
     * @param min the minimum number it can be to satisfy this constraint
     * @param max the maximum number it can be to satisfy this constraint
     */
    constexpr NumberValueConstraint(NumType min, NumType max) : min_{min}, max_{max}
    {
    }

    constexpr ~NumberValueConstraint() noexcept override = default;

private:
    [[nodiscard]] std::optional<Error>
    checkTypeImpl(Value const& num) const override
    {
        if (!std::holds_alternative<int64_t>(num))
            return Error{"Number must be of type integer"};
        return std::nullopt;
    }

    [[nodiscard]] std::optional<Error>
    checkValueImpl(Value const& num) const override
    {
        auto const numValue = std::get<int64_t>(num);
        if (numValue >= static_cast<int64_t>(min_) && numValue <= static_cast<int64_t>(max_))
            return std::nullopt;
        return Error{fmt::format("Number must be between {} and {}", min_, max_)};
    }

    NumType min_;
    NumType max_;
};

static constinit PortConstraint gValidatePort{};
static constinit OneOf gValidateLogLevelName{"log_level", kLOG_LEVEL_NAMES};
static constinit OneOf gValidateChannelName{"channel", kCHANNEL_NAMES};

static constinit NumberValueConstraint<uint16_t> gValidateUint16{
    std::numeric_limits<uint16_t>::min(),
    std::numeric_limits<uint16_t>::max()
};
static constinit NumberValueConstraint<uint32_t> gValidateUint32{
    std::numeric_limits<uint32_t>::min(),
    std::numeric_limits<uint32_t>::max()
};
static constinit NumberValueConstraint<uint32_t> gValidatePositiveUint32{1u, std::numeric_limits<uint32_t>::max()};

/** @brief Largest TTL in seconds Cassandra accepts (20 years) */
static constexpr uint32_t kMAX_CASSANDRA_TTL = 630720000u;
static constinit NumberValueConstraint<uint32_t> gValidateTtl{1u, kMAX_CASSANDRA_TTL};

}  // namespace util::config
