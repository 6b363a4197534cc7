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

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace migration {

/**
 * @brief Where a version stands in the target cluster, as shown by the status command
 */
class MigrationStatus {
public:
    /**
     * @brief Applied when the tracking table records the version, Pending when it is registered but not recorded.
     * NotKnown when the tracking table can't be read or the recorded version is missing from the registry.
     */
    enum Status { Applied, Pending, NotKnown, NumStatuses };

    MigrationStatus(Status status) : status_(status)
    {
    }

    bool
    operator==(MigrationStatus const& other) const;

    bool
    operator==(Status const& other) const;

    /**
     * @brief Convert the status to string
     *
     * @return The name of the status
     */
    std::string
    toString() const;

    /**
     * @brief Whether the registry and the cluster disagree about this version, which makes the status command fail
     *
     * @return true for NotKnown
     */
    bool
    requiresAttention() const;

    /**
     * @brief Describe what the migrate command does with a version in this status
     *
     * @return A short human readable hint
     */
    std::string_view
    nextStep() const;

private:
    static constexpr std::array<char const*, static_cast<size_t>(NumStatuses)> kSTATUS_STR_MAP = {
        "Applied",
        "Pending",
        "NotKnown"
    };

    static constexpr std::array<std::string_view, static_cast<size_t>(NumStatuses)> kNEXT_STEP_MAP = {
        "skipped by migrate",
        "applied by the next migrate",
        "check the tracking table and the scripts directory"
    };

    Status status_;
};

}  // namespace migration
