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
#include "migration/MigrationResources.hpp"
#include "migration/MigrationResourcesProviderInterface.hpp"
#include "migration/MigrationScript.hpp"

#include <expected>
#include <utility>
#include <vector>

namespace migration {

/**
 * @brief Provides the registry from scripts compiled into the application
 */
class ListResourcesProvider : public MigrationResourcesProviderInterface {
    std::vector<MigrationScript> scripts_;

public:
    explicit ListResourcesProvider(std::vector<MigrationScript> scripts) : scripts_{std::move(scripts)}
    {
    }

    [[nodiscard]] std::expected<MigrationResources, MigrationError>
    load() const override
    {
        return makeMigrationResources(scripts_);
    }
};

}  // namespace migration
