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

#include "migration/MigrationStatus.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace migration {

bool
MigrationStatus::operator==(MigrationStatus const& other) const
{
    return status_ == other.status_;
}

bool
MigrationStatus::operator==(Status const& other) const
{
    return status_ == other;
}

std::string
MigrationStatus::toString() const
{
    return kSTATUS_STR_MAP[static_cast<size_t>(status_)];
}

bool
MigrationStatus::requiresAttention() const
{
    return status_ == NotKnown;
}

std::string_view
MigrationStatus::nextStep() const
{
    return kNEXT_STEP_MAP[static_cast<size_t>(status_)];
}

}  // namespace migration
