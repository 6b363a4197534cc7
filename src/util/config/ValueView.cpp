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

#include "util/config/ValueView.hpp"

#include "util/Assert.hpp"
#include "util/config/ConfigValue.hpp"
#include "util/config/Types.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace util::config {

ValueView::ValueView(ConfigValue const& configVal) : configVal_{configVal}
{
}

std::string_view
ValueView::asString() const
{
    ASSERT(type() == ConfigType::String, "Value is not of type string");
    return std::get<std::string>(configVal_.get().getValue());
}

bool
ValueView::asBool() const
{
    ASSERT(type() == ConfigType::Boolean, "Value is not of type boolean");
    return std::get<bool>(configVal_.get().getValue());
}

double
ValueView::asDouble() const
{
    ASSERT(type() == ConfigType::Double, "Value is not of type double");
    return std::get<double>(configVal_.get().getValue());
}

}  // namespace util::config
