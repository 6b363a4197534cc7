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

#include "migration/DirectoryResourcesProvider.hpp"

#include "migration/MigrationError.hpp"
#include "migration/MigrationResources.hpp"
#include "migration/MigrationScript.hpp"
#include "migration/Types.hpp"
#include "migration/impl/CqlScript.hpp"
#include "util/log/Logger.hpp"

#include <boost/algorithm/string/replace.hpp>
#include <boost/filesystem/directory.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <fmt/core.h>

#include <charconv>
#include <expected>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace migration {

namespace {

std::unexpected<MigrationError>
loadError(std::string message)
{
    return std::unexpected{MigrationError{MigrationError::Kind::ScriptLoadError, std::move(message)}};
}

}  // namespace

DirectoryResourcesProvider::DirectoryResourcesProvider(boost::filesystem::path directory)
    : directory_{std::move(directory)}
{
}

std::expected<MigrationResources, MigrationError>
DirectoryResourcesProvider::load() const
{
    boost::system::error_code ec;
    if (not boost::filesystem::is_directory(directory_, ec) or ec)
        return loadError(fmt::format("'{}' is not a readable directory", directory_.string()));

    std::vector<MigrationScript> scripts;
    auto const end = boost::filesystem::directory_iterator{};
    for (auto it = boost::filesystem::directory_iterator{directory_, ec}; not ec and it != end; it.increment(ec)) {
        auto const& path = it->path();
        if (not boost::filesystem::is_regular_file(path) or path.extension() != ".cql") {
            LOG(log_.trace()) << "Skipping " << path.string();
            continue;
        }

        auto script = loadScript(path);
        if (not script.has_value())
            return std::unexpected{std::move(script).error()};

        LOG(log_.debug()) << "Loaded version " << script->version << " from " << path.filename().string();
        scripts.push_back(std::move(script).value());
    }

    if (ec)
        return loadError(fmt::format("Could not list '{}': {}", directory_.string(), ec.message()));

    LOG(log_.info()) << "Loaded " << scripts.size() << " scripts from " << directory_.string();
    return makeMigrationResources(std::move(scripts));
}

std::expected<MigrationScript, MigrationError>
DirectoryResourcesProvider::loadScript(boost::filesystem::path const& file) const
{
    auto const stem = file.stem().string();
    auto const separator = stem.find("__");
    if (not stem.starts_with('V') or separator == std::string::npos or separator < 2 or
        separator + 2 == stem.size()) {
        return loadError(fmt::format("'{}' does not follow the V<version>__<description>.cql pattern", file.string()));
    }

    Version version = 0;
    auto const* first = stem.data() + 1;
    auto const* last = stem.data() + separator;
    if (auto const [ptr, errc] = std::from_chars(first, last, version); errc != std::errc{} or ptr != last)
        return loadError(fmt::format("'{}' has an invalid version number", file.string()));

    std::ifstream stream(file.string());
    if (not stream)
        return loadError(fmt::format("Could not open '{}'", file.string()));

    std::string const text{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
    if (stream.bad())
        return loadError(fmt::format("Could not read '{}'", file.string()));

    auto statements = impl::splitStatements(text);
    if (statements.empty())
        return loadError(fmt::format("'{}' contains no statements", file.string()));

    auto description = stem.substr(separator + 2);
    boost::algorithm::replace_all(description, "_", " ");

    return makeStatementScript(version, std::move(description), std::move(statements));
}

}  // namespace migration
