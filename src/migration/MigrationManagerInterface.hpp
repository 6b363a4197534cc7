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
#include "migration/MigrationInspectorInterface.hpp"

#include <expected>
#include <stop_token>

namespace migration {

/**
 * @brief The interface for the migration manager. The application uses this interface to run the migrations once
 * during its initialization. Unlike the MigrationInspectorInterface which only provides the status of migration, this
 * interface contains the actual migration running method.
 */
struct MigrationManagerInterface : virtual public MigrationInspectorInterface {
    /**
     * @brief Apply all pending scripts
     *
     * @param stopToken Requests cancellation between scripts
     * @return The report of the run or its failure
     */
    virtual std::expected<MigrationReport, MigrationFailure>
    runMigrations(std::stop_token stopToken) = 0;
};

}  // namespace migration
