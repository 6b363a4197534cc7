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

#include "migration/MigrationEngine.hpp"

#include "migration/MigrationError.hpp"
#include "migration/MigrationResources.hpp"
#include "migration/MigrationScript.hpp"
#include "migration/SchemaAgreementExecutorInterface.hpp"
#include "migration/TrackingRecord.hpp"
#include "migration/TrackingStoreInterface.hpp"
#include "migration/Types.hpp"
#include "migration/impl/LeaseLock.hpp"
#include "util/config/ObjectView.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/ip/host_name.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <memory>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace migration {

namespace {

std::set<Version>
toVersions(std::vector<TrackingRecord> const& records)
{
    std::set<Version> versions;
    for (auto const& record : records)
        versions.insert(record.version);
    return versions;
}

std::vector<MigrationScript const*>
pendingScripts(MigrationResources const& resources, std::set<Version> const& applied)
{
    std::vector<MigrationScript const*> pending;
    for (auto const& script : resources) {
        if (not applied.contains(script.version))
            pending.push_back(&script);
    }
    return pending;
}

TrackingRecord
makeRecord(MigrationScript const& script)
{
    return TrackingRecord{
        .version = script.version,
        .description = script.description,
        .appliedAt = std::chrono::system_clock::now(),
        .checksum = script.checksum
    };
}

}  // namespace

EngineSettings
EngineSettings::make(util::config::ObjectView const& config)
{
    EngineSettings settings;
    settings.lockTtl = std::chrono::seconds{config.get<uint32_t>("lock_ttl")};
    settings.lockTimeout = std::chrono::seconds{config.get<uint32_t>("lock_timeout")};
    settings.lockPollInterval = std::chrono::milliseconds{config.get<uint32_t>("lock_poll_interval")};
    if (auto const runTimeout = config.maybeValue<uint32_t>("run_timeout"); runTimeout.has_value())
        settings.runTimeout = std::chrono::seconds{*runTimeout};
    settings.validateChecksums = config.get<bool>("validate_checksums");
    settings.ownerId =
        fmt::format("{}/{}", boost::asio::ip::host_name(), boost::uuids::to_string(boost::uuids::random_generator()()));
    return settings;
}

MigrationEngine::MigrationEngine(
    std::shared_ptr<TrackingStoreInterface> store,
    std::shared_ptr<SchemaAgreementExecutorInterface> executor,
    EngineSettings settings
)
    : store_{std::move(store)}, executor_{std::move(executor)}, settings_{std::move(settings)}
{
}

char const*
MigrationEngine::stateToString(State state)
{
    static constexpr std::array<char const*, 6> kSTATE_STR_MAP = {
        "INIT", "LOADING_STATE", "COMPUTING_PENDING", "APPLYING", "DONE", "FAILED"
    };
    return kSTATE_STR_MAP[static_cast<std::size_t>(state)];
}

void
MigrationEngine::transition(State next)
{
    LOG(log_.debug()) << "Engine state " << stateToString(state_) << " -> " << stateToString(next);
    state_ = next;
}

std::expected<MigrationReport, MigrationFailure>
MigrationEngine::migrate(MigrationResources const& resources, std::stop_token stopToken)
{
    auto const startedAt = std::chrono::steady_clock::now();
    MigrationReport report;
    std::set<Version> applied;

    auto fail = [&](MigrationError error) {
        transition(State::Failed);
        LOG(log_.error()) << "Migration failed: " << error;

        std::optional<Version> lastApplied;
        if (not applied.empty())
            lastApplied = *applied.rbegin();

        return std::unexpected{MigrationFailure{
            .error = std::move(error), .applied = report.applied, .lastAppliedVersion = lastApplied
        }};
    };

    auto const validate = [&](std::vector<TrackingRecord> const& records) -> std::expected<void, MigrationError> {
        for (auto const& record : records) {
            auto const* script = resources.find(record.version);
            if (script == nullptr) {
                LOG(log_.warn()) << "Version " << record.version << " ('" << record.description
                                 << "') is applied but not registered";
                continue;
            }

            if (settings_.validateChecksums and record.checksum.has_value() and script->checksum.has_value() and
                *record.checksum != *script->checksum) {
                auto const error = MigrationError{
                    MigrationError::Kind::ChecksumMismatch,
                    fmt::format(
                        "version {} was applied with checksum {} but the registered script has {}",
                        record.version,
                        *record.checksum,
                        *script->checksum
                    )
                };
                return std::unexpected{error.withVersion(record.version)};
            }
        }
        return {};
    };

    state_ = State::Init;
    transition(State::LoadingState);

    auto records = store_->getAppliedRecords();
    if (not records and records.error().kind == MigrationError::Kind::TrackingStoreMissing and
        resources.firstVersion() == kINITIALIZE_VERSION) {
        LOG(log_.info()) << "Tracking store does not exist yet; bootstrapping with version " << kINITIALIZE_VERSION;

        auto const recorded = bootstrap(resources);
        if (not recorded)
            return fail(recorded.error());

        if (*recorded) {
            report.applied.push_back(kINITIALIZE_VERSION);
        } else {
            LOG(log_.info()) << "Version " << kINITIALIZE_VERSION << " was recorded by another applier";
            report.observed.push_back(kINITIALIZE_VERSION);
        }
        applied.insert(kINITIALIZE_VERSION);

        records = store_->getAppliedRecords();
    }

    if (not records)
        return fail(records.error());

    if (auto const valid = validate(*records); not valid)
        return fail(valid.error());

    transition(State::ComputingPending);
    for (auto const version : toVersions(*records))
        applied.insert(version);

    if (pendingScripts(resources, applied).empty()) {
        LOG(log_.info()) << "Schema is up to date; nothing to apply";
        transition(State::Done);
        return report;
    }

    auto lock = impl::LeaseLock::acquire(
        store_,
        settings_.ownerId,
        {.ttl = settings_.lockTtl, .timeout = settings_.lockTimeout, .pollInterval = settings_.lockPollInterval},
        stopToken
    );
    if (not lock)
        return fail(lock.error());

    // another applier may have progressed while we waited for the lock
    records = store_->getAppliedRecords();
    if (not records)
        return fail(records.error());

    if (auto const valid = validate(*records); not valid)
        return fail(valid.error());

    for (auto const version : toVersions(*records))
        applied.insert(version);
    auto const pending = pendingScripts(resources, applied);
    LOG(log_.info()) << pending.size() << " script(s) pending";

    transition(State::Applying);
    for (auto const* script : pending) {
        if (stopToken.stop_requested()) {
            return fail(MigrationError{
                MigrationError::Kind::Cancelled,
                fmt::format("cancelled before applying version {}", script->version)
            });
        }

        if (settings_.runTimeout.has_value() and std::chrono::steady_clock::now() - startedAt > *settings_.runTimeout) {
            return fail(MigrationError{
                MigrationError::Kind::Cancelled,
                fmt::format("run timeout reached before applying version {}", script->version)
            });
        }

        // a run may outlast a single lease, so the lease is extended before every script
        if (auto const renewed = lock->renew(); not renewed)
            return fail(renewed.error().withVersion(script->version));

        LOG(log_.info()) << "Applying version " << script->version << ": " << script->description;
        if (auto const res = applyScript(*script); not res)
            return fail(res.error());

        auto const recorded = store_->recordApplied(makeRecord(*script));
        if (not recorded)
            return fail(recorded.error().withVersion(script->version));

        // the initialize script also runs unlocked during bootstrap, so losing its record is not a conflict
        if (not *recorded and script->version == kINITIALIZE_VERSION) {
            LOG(log_.info()) << "Version " << script->version << " was recorded by another applier";
            applied.insert(script->version);
            report.observed.push_back(script->version);
            continue;
        }

        if (not *recorded) {
            auto const error = MigrationError{
                MigrationError::Kind::ConcurrentApplication,
                fmt::format("version {} was recorded by another applier", script->version)
            };
            return fail(error.withVersion(script->version));
        }

        applied.insert(script->version);
        report.applied.push_back(script->version);
        LOG(log_.info()) << "Applied version " << script->version;
    }

    transition(State::Done);
    LOG(log_.info()) << "Migration finished; applied " << report.applied.size() << " script(s)";
    return report;
}

std::expected<bool, MigrationError>
MigrationEngine::bootstrap(MigrationResources const& resources) const
{
    auto const* script = resources.find(kINITIALIZE_VERSION);
    if (auto const res = applyScript(*script); not res)
        return std::unexpected{res.error()};

    return store_->recordApplied(makeRecord(*script)).transform_error([](auto const& error) {
        return error.withVersion(kINITIALIZE_VERSION);
    });
}

std::expected<void, MigrationError>
MigrationEngine::applyScript(MigrationScript const& script) const
{
    ScriptContext context{script.version, *executor_};
    try {
        script.action(context);
    } catch (StatementFailure const& failure) {
        return std::unexpected{failure.error()};
    } catch (std::exception const& e) {
        auto error = MigrationError{
            MigrationError::Kind::ExecutionError,
            fmt::format("action of version {} threw: {}", script.version, e.what())
        };
        error.version = script.version;

        if (context.executedStatements() > 0) {
            error.cause = error.kind;
            error.kind = MigrationError::Kind::PartialMigrationFailure;
            error.lastSuccessfulStatement = context.executedStatements();
        }
        return std::unexpected{std::move(error)};
    }

    LOG(log_.debug()) << "Version " << script.version << " executed " << context.executedStatements()
                      << " statement(s)";
    return {};
}

}  // namespace migration
