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

#include "migration/MigrationEngine.hpp"
#include "migration/MigrationError.hpp"
#include "migration/MigrationManagerInterface.hpp"
#include "migration/MigrationResources.hpp"
#include "migration/SchemaAgreementExecutorInterface.hpp"
#include "migration/TrackingStoreInterface.hpp"
#include "migration/impl/MigrationInspectorBase.hpp"

#include <expected>
#include <memory>
#include <stop_token>
#include <utility>

namespace migration::impl {

/**
 * @brief The migration manager implementation. It runs the engine over the registry it was created with.
 */
class MigrationManagerBase : public MigrationManagerInterface, public MigrationInspectorBase {
    MigrationEngine engine_;

public:
    /**
     * @brief Construct a new Migration Manager object
     *
     * @param store The tracking store of the target cluster
     * @param executor The schema agreement executor bound to the same cluster
     * @param resources The registry
     * @param settings The engine settings
     */
    MigrationManagerBase(
        std::shared_ptr<TrackingStoreInterface> store,
        std::shared_ptr<SchemaAgreementExecutorInterface> executor,
        MigrationResources resources,
        EngineSettings settings
    )
        : MigrationInspectorBase{store, std::move(resources)}
        , engine_{std::move(store), std::move(executor), std::move(settings)}
    {
    }

    std::expected<MigrationReport, MigrationFailure>
    runMigrations(std::stop_token stopToken) override
    {
        return engine_.migrate(this->resources_, std::move(stopToken));
    }
};

}  // namespace migration::impl
