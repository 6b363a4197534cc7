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

#include "util/config/ArrayView.hpp"

#include "util/Assert.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/config/ObjectView.hpp"
#include "util/config/ValueView.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace util::config {

ArrayView::ArrayView(std::string_view prefix, ConfigDefinition const& configDef)
    : prefix_{std::string{prefix} + ".[]"}, configDef_{configDef}
{
    ASSERT(configDef_.get().hasItemsWithPrefix(prefix_), "Array {} doesn't exist in config", prefix);
}

ObjectView
ArrayView::objectAt(std::size_t idx) const
{
    ASSERT(idx < size(), "Object index is out of scope");
    return ObjectView{prefix_, idx, configDef_.get()};
}

ValueView
ArrayView::valueAt(std::size_t idx) const
{
    ASSERT(configDef_.get().contains(prefix_), "ArrayView {} does not hold plain values", prefix_);
    return configDef_.get().getValueInArray(prefix_, idx);
}

std::size_t
ArrayView::size() const
{
    return configDef_.get().arraySize(prefix_);
}

}  // namespace util::config
