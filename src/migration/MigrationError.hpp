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

#include "migration/Types.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace migration {

/**
 * @brief Describes why a migration run (or the construction of its inputs) failed
 */
struct MigrationError {
    /**
     * @brief The category of the failure
     */
    enum class Kind {
        Connectivity,
        TrackingStoreMissing,
        AgreementTimeout,
        ExecutionError,
        PartialMigrationFailure,
        DuplicateVersion,
        InvalidVersion,
        TrackingWriteFailed,
        ConcurrentApplication,
        LockTimeout,
        LockLost,
        ChecksumMismatch,
        Cancelled,
        ScriptLoadError,
        NumKinds
    };

    Kind kind;
    std::string message;

    /** @brief The script version the failure relates to, if any */
    std::optional<Version> version = std::nullopt;

    /** @brief 1-based index of the failing statement within the script, if known */
    std::optional<std::size_t> failedStatement = std::nullopt;

    /** @brief 1-based index of the last statement that reached agreement, if any */
    std::optional<std::size_t> lastSuccessfulStatement = std::nullopt;

    /** @brief For PartialMigrationFailure, the kind of the failure of the statement itself */
    std::optional<Kind> cause = std::nullopt;

    MigrationError(Kind kind, std::string message) : kind{kind}, message{std::move(message)}
    {
    }

    /**
     * @brief Returns a copy of this error bound to the given version
     *
     * @param ver The version of the failing script
     * @return The updated error
     */
    [[nodiscard]] MigrationError
    withVersion(Version ver) const;

    /**
     * @brief Human readable representation including the version and statement indices when present
     *
     * @return The description
     */
    [[nodiscard]] std::string
    toString() const;

    /**
     * @brief Convert a kind to its name
     *
     * @param kind The kind
     * @return The name of the kind
     */
    [[nodiscard]] static char const*
    kindToString(Kind kind);

    bool
    operator==(MigrationError const&) const = default;

private:
    static constexpr std::array<char const*, static_cast<std::size_t>(Kind::NumKinds)> kKIND_STR_MAP = {
        "Connectivity",
        "TrackingStoreMissing",
        "AgreementTimeout",
        "ExecutionError",
        "PartialMigrationFailure",
        "DuplicateVersion",
        "InvalidVersion",
        "TrackingWriteFailed",
        "ConcurrentApplication",
        "LockTimeout",
        "LockLost",
        "ChecksumMismatch",
        "Cancelled",
        "ScriptLoadError",
    };
};

std::ostream&
operator<<(std::ostream& stream, MigrationError const& err);

/**
 * @brief The outcome of a successful migration run
 */
struct MigrationReport {
    /** @brief Versions applied by this run, ascending */
    std::vector<Version> applied;

    /** @brief Versions found applied by a concurrently running instance while this run tried to apply them */
    std::vector<Version> observed;
};

/**
 * @brief The outcome of a failed migration run
 */
struct MigrationFailure {
    MigrationError error;

    /** @brief Versions this run applied and recorded before the failure */
    std::vector<Version> applied;

    /** @brief The highest version known to be applied when the run stopped */
    std::optional<Version> lastAppliedVersion;
};

}  // namespace migration
