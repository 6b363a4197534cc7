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

#include "migration/MigrationError.hpp"

#include "migration/Types.hpp"

#include <fmt/core.h>

#include <cstddef>
#include <ostream>
#include <string>

namespace migration {

MigrationError
MigrationError::withVersion(Version ver) const
{
    auto copy = *this;
    copy.version = ver;
    return copy;
}

char const*
MigrationError::kindToString(Kind kind)
{
    return kKIND_STR_MAP[static_cast<std::size_t>(kind)];
}

std::string
MigrationError::toString() const
{
    auto result = std::string{kindToString(kind)};
    if (version.has_value())
        result += fmt::format(" [version {}]", *version);

    if (failedStatement.has_value()) {
        result += fmt::format(" [statement {}", *failedStatement);
        if (lastSuccessfulStatement.has_value())
            result += fmt::format(", last successful {}", *lastSuccessfulStatement);
        result += "]";
    }

    if (cause.has_value())
        result += fmt::format(" caused by {}", kindToString(*cause));

    return result + ": " + message;
}

std::ostream&
operator<<(std::ostream& stream, MigrationError const& err)
{
    return stream << err.toString();
}

}  // namespace migration
