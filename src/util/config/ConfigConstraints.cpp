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

#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace util::config {

std::optional<Error>
PortConstraint::checkTypeImpl(Value const& port) const
{
    if (!std::holds_alternative<int64_t>(port))
        return Error{"Port must be an integer"};
    return std::nullopt;
}

std::optional<Error>
PortConstraint::checkValueImpl(Value const& port) const
{
    auto const value = std::get<int64_t>(port);
    if (value >= kPORT_MIN && value <= kPORT_MAX)
        return std::nullopt;
    return Error{fmt::format("Port does not satisfy the constraint bounds {}-{}", kPORT_MIN, kPORT_MAX)};
}

std::optional<Error>
OneOf::checkTypeImpl(Value const& val) const
{
    if (!std::holds_alternative<std::string>(val))
        return Error{fmt::format(R"(Key "{}"'s value must be a string)", key_)};
    return std::nullopt;
}

std::optional<Error>
OneOf::checkValueImpl(Value const& val) const
{
    auto const& str = std::get<std::string>(val);
    if (std::ranges::find(arr_, str) != arr_.end())
        return std::nullopt;
    return Error{fmt::format(R"(You provided value "{}". Key "{}"'s value must be one of the following: {})", str, key_, fmt::join(arr_, ", "))};
}

}  // namespace util::config
