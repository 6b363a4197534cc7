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

#include "util/config/ObjectView.hpp"

#include "util/Assert.hpp"
#include "util/config/ArrayView.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/config/ValueView.hpp"

#include <fmt/core.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace util::config {

ObjectView::ObjectView(std::string_view prefix, ConfigDefinition const& configDef)
    : prefix_{prefix}, configDef_{configDef}
{
    ASSERT(configDef_.get().hasItemsWithPrefix(prefix_), "Prefix {} doesn't exist in config", prefix_);
}

ObjectView::ObjectView(std::string_view prefix, std::size_t arrayIndex, ConfigDefinition const& configDef)
    : prefix_{prefix}, arrayIndex_{arrayIndex}, configDef_{configDef}
{
}

bool
ObjectView::containsKey(std::string_view key) const
{
    return configDef_.get().contains(getFullKey(key));
}

ValueView
ObjectView::getValueView(std::string_view key) const
{
    auto const fullKey = getFullKey(key);
    if (arrayIndex_.has_value())
        return configDef_.get().getValueInArray(fullKey, *arrayIndex_);
    return configDef_.get().getValueView(fullKey);
}

ObjectView
ObjectView::getObject(std::string_view key) const
{
    ASSERT(not arrayIndex_.has_value(), "Nested objects inside arrays are not supported");
    return ObjectView{getFullKey(key), configDef_.get()};
}

ArrayView
ObjectView::getArray(std::string_view key) const
{
    ASSERT(not arrayIndex_.has_value(), "Nested arrays are not supported");
    return ArrayView{getFullKey(key), configDef_.get()};
}

std::string
ObjectView::getFullKey(std::string_view key) const
{
    return fmt::format("{}.{}", prefix_, key);
}

}  // namespace util::config
