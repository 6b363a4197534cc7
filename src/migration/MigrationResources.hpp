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

#include "migration/MigrationError.hpp"
#include "migration/MigrationScript.hpp"
#include "migration/Types.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <utility>
#include <vector>

namespace migration {

/**
 * @brief Immutable collection of migration scripts ordered by ascending version.
 *
 * Use @ref makeMigrationResources to create one; it guarantees unique and positive versions.
 */
class MigrationResources {
    std::vector<MigrationScript> scripts_;

    explicit MigrationResources(std::vector<MigrationScript> scripts) : scripts_{std::move(scripts)}
    {
    }

    friend std::expected<MigrationResources, MigrationError>
    makeMigrationResources(std::vector<MigrationScript> scripts);

public:
    using const_iterator = std::vector<MigrationScript>::const_iterator;

    [[nodiscard]] const_iterator
    begin() const
    {
        return scripts_.cbegin();
    }

    [[nodiscard]] const_iterator
    end() const
    {
        return scripts_.cend();
    }

    [[nodiscard]] std::size_t
    size() const
    {
        return scripts_.size();
    }

    [[nodiscard]] bool
    empty() const
    {
        return scripts_.empty();
    }

    /**
     * @brief Find a script by version
     *
     * @param version The version to look for
     * @return Pointer to the script or nullptr when not registered
     */
    [[nodiscard]] MigrationScript const*
    find(Version version) const;

    /**
     * @return The registered versions, ascending
     */
    [[nodiscard]] std::vector<Version>
    versions() const;

    /**
     * @return The lowest registered version if any
     */
    [[nodiscard]] std::optional<Version>
    firstVersion() const;
};

/**
 * @brief Validate and sort the given scripts
 *
 * @param scripts The scripts in any order
 * @return The registry; DuplicateVersion or InvalidVersion error otherwise
 */
[[nodiscard]] std::expected<MigrationResources, MigrationError>
makeMigrationResources(std::vector<MigrationScript> scripts);

}  // namespace migration
