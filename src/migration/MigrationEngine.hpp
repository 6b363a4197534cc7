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
#include "migration/MigrationScript.hpp"
#include "migration/SchemaAgreementExecutorInterface.hpp"
#include "migration/TrackingRecord.hpp"
#include "migration/TrackingStoreInterface.hpp"
#include "migration/Types.hpp"
#include "util/config/ObjectView.hpp"
#include "util/log/Logger.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

namespace migration {

/**
 * @brief Settings of a migration run
 */
struct EngineSettings {
    std::chrono::seconds lockTtl = std::chrono::seconds{300};
    std::chrono::milliseconds lockTimeout = std::chrono::seconds{60};
    std::chrono::milliseconds lockPollInterval = std::chrono::seconds{1};
    std::optional<std::chrono::milliseconds> runTimeout = std::nullopt;
    bool validateChecksums = true;

    /** @brief Identifies this applier in the lease lock row */
    std::string ownerId;

    /**
     * @brief Read the settings from the `migration` section of the config. The owner id is generated.
     *
     * @param config The migration config
     * @return The settings
     */
    static EngineSettings
    make(util::config::ObjectView const& config);
};

/**
 * @brief Applies pending migration scripts in ascending version order.
 *
 * A run moves through INIT, LOADING_STATE, COMPUTING_PENDING and APPLYING to DONE, or to FAILED on the first error.
 * Scripts run strictly one after another while the lease lock of the tracking store is held; every statement waits
 * for schema agreement. A version is recorded only after all its statements succeeded.
 */
class MigrationEngine {
public:
    enum class State { Init, LoadingState, ComputingPending, Applying, Done, Failed };

private:
    util::Logger log_{"Migration"};
    std::shared_ptr<TrackingStoreInterface> store_;
    std::shared_ptr<SchemaAgreementExecutorInterface> executor_;
    EngineSettings settings_;
    std::atomic<State> state_ = State::Init;

public:
    /**
     * @brief Construct a new engine
     *
     * @param store The tracking store of the target cluster
     * @param executor The schema agreement executor bound to the same cluster
     * @param settings The run settings
     */
    MigrationEngine(
        std::shared_ptr<TrackingStoreInterface> store,
        std::shared_ptr<SchemaAgreementExecutorInterface> executor,
        EngineSettings settings
    );

    /**
     * @brief Bring the cluster up to the latest version of the registry.
     *
     * Cancellation through the stop token or the run timeout is honoured between scripts only.
     *
     * @param resources The registry
     * @param stopToken Requests cancellation
     * @return What was applied; or the failure with what was applied before it
     */
    [[nodiscard]] std::expected<MigrationReport, MigrationFailure>
    migrate(MigrationResources const& resources, std::stop_token stopToken = {});

    /**
     * @return The state of the current or last run
     */
    [[nodiscard]] State
    state() const
    {
        return state_;
    }

    [[nodiscard]] static char const*
    stateToString(State state);

private:
    void
    transition(State next);

    [[nodiscard]] std::expected<void, MigrationError>
    applyScript(MigrationScript const& script) const;

    [[nodiscard]] std::expected<bool, MigrationError>
    bootstrap(MigrationResources const& resources) const;
};

}  // namespace migration
