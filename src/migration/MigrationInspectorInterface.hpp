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

#include "migration/MigrationStatus.hpp"
#include "migration/Types.hpp"

#include <string>
#include <tuple>
#include <vector>

namespace migration {

/**
 * @brief The interface for the migration inspector. The application uses it to report the migration status without
 * changing the schema.
 */
struct MigrationInspectorInterface {
    virtual ~MigrationInspectorInterface() = default;

    /**
     * @brief Get the status of all the scripts, registered or recorded as applied
     *
     * @return A vector of tuples of version, description and status, ascending by version
     */
    virtual std::vector<std::tuple<Version, std::string, MigrationStatus>>
    allScriptsStatus() const = 0;

    /**
     * @brief Get the status of a script by its version
     *
     * @param version The version
     * @return The status; NotKnown if neither registered nor applied, or if the store can't be read
     */
    virtual MigrationStatus
    getStatusByVersion(Version version) const = 0;

    /**
     * @brief Get the versions that a run would apply
     *
     * @return The pending versions, ascending; empty if the store can't be read
     */
    virtual std::vector<Version>
    pendingVersions() const = 0;

    /**
     * @brief Return if the schema is behind the registry
     *
     * @return True if any registered script is not applied
     */
    virtual bool
    hasPending() const = 0;
};

}  // namespace migration
