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
#include "util/log/Logger.hpp"

#include <boost/filesystem/path.hpp>

#include <expected>
#include <string>
#include <vector>

namespace migration {

/**
 * @brief Provides the registry from `.cql` files in a directory.
 *
 * Files must be named `V<version>__<description>.cql`, underscores in the description are shown as spaces. Files with
 * other extensions are ignored. Each file becomes one script whose statements run in order of appearance.
 */
class DirectoryResourcesProvider : public MigrationResourcesProviderInterface {
    util::Logger log_{"Migration"};
    boost::filesystem::path directory_;

public:
    explicit DirectoryResourcesProvider(boost::filesystem::path directory);

    [[nodiscard]] std::expected<MigrationResources, MigrationError>
    load() const override;

private:
    [[nodiscard]] std::expected<MigrationScript, MigrationError>
    loadScript(boost::filesystem::path const& file) const;
};

}  // namespace migration
