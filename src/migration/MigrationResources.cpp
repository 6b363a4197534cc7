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

#include "migration/MigrationResources.hpp"

#include "migration/MigrationError.hpp"
#include "migration/MigrationScript.hpp"
#include "migration/Types.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <expected>
#include <iterator>
#include <optional>
#include <ranges>
#include <utility>
#include <vector>

namespace migration {

MigrationScript const*
MigrationResources::find(Version version) const
{
    auto const it = std::ranges::lower_bound(scripts_, version, {}, &MigrationScript::version);
    if (it == scripts_.end() or it->version != version)
        return nullptr;
    return &(*it);
}

std::vector<Version>
MigrationResources::versions() const
{
    std::vector<Version> result;
    result.reserve(scripts_.size());
    std::ranges::transform(scripts_, std::back_inserter(result), &MigrationScript::version);
    return result;
}

std::optional<Version>
MigrationResources::firstVersion() const
{
    if (scripts_.empty())
        return std::nullopt;
    return scripts_.front().version;
}

std::expected<MigrationResources, MigrationError>
makeMigrationResources(std::vector<MigrationScript> scripts)
{
    if (auto const it = std::ranges::find_if(scripts, [](auto const& script) { return script.version <= 0; });
        it != scripts.end()) {
        auto err = MigrationError{
            MigrationError::Kind::InvalidVersion,
            fmt::format("script '{}' has non-positive version {}", it->description, it->version)
        };
        err.version = it->version;
        return std::unexpected{std::move(err)};
    }

    if (auto const it = std::ranges::find_if(scripts, [](auto const& script) { return not script.action; });
        it != scripts.end()) {
        auto const err =
            MigrationError{MigrationError::Kind::ScriptLoadError, fmt::format("script '{}' has no action", it->description)};
        return std::unexpected{err.withVersion(it->version)};
    }

    std::ranges::stable_sort(scripts, {}, &MigrationScript::version);

    if (auto const it = std::ranges::adjacent_find(scripts, {}, &MigrationScript::version); it != scripts.end()) {
        auto err = MigrationError{
            MigrationError::Kind::DuplicateVersion,
            fmt::format(
                "version {} is used by both '{}' and '{}'", it->version, it->description, std::next(it)->description
            )
        };
        err.version = it->version;
        return std::unexpected{std::move(err)};
    }

    return MigrationResources{std::move(scripts)};
}

}  // namespace migration
