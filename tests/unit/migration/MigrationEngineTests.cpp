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
#include "migration/TestScripts.hpp"
#include "migration/TrackingRecord.hpp"
#include "migration/Types.hpp"
#include "util/FakeTrackingStore.hpp"
#include "util/LoggerFixtures.hpp"
#include "util/MockMigrationFixture.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/config/ConfigFileJson.hpp"

#include <boost/json/parse.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace migration;
using testing::_;
using testing::Return;

namespace {

EngineSettings
testSettings(std::string owner = "test/owner")
{
    return EngineSettings{
        .lockTtl = std::chrono::seconds{30},
        .lockTimeout = std::chrono::seconds{5},
        .lockPollInterval = std::chrono::milliseconds{1},
        .runTimeout = std::nullopt,
        .validateChecksums = true,
        .ownerId = std::move(owner)
    };
}

MigrationResources
resourcesOf(std::vector<MigrationScript> scripts)
{
    auto resources = makeMigrationResources(std::move(scripts));
    if (not resources.has_value())
        throw std::logic_error(resources.error().toString());
    return std::move(resources).value();
}

TrackingRecord
recordOf(MigrationScript const& script)
{
    return TrackingRecord{
        .version = script.version,
        .description = script.description,
        .appliedAt = std::chrono::system_clock::now(),
        .checksum = script.checksum
    };
}

}  // namespace

struct MigrationEngineTest : NoLoggerFixture {
protected:
    std::shared_ptr<FakeTrackingStore> store_ = std::make_shared<FakeTrackingStore>();
    std::shared_ptr<FakeSchemaAgreementExecutor> executor_ = std::make_shared<FakeSchemaAgreementExecutor>(store_.get());

    MigrationEngine
    makeEngine(EngineSettings settings = testSettings())
    {
        return MigrationEngine{store_, executor_, std::move(settings)};
    }

    void
    seed(std::vector<MigrationScript> const& scripts)
    {
        store_->createTable();
        for (auto const& script : scripts)
            ASSERT_TRUE(store_->recordApplied(recordOf(script)).value());
    }

    bool
    executed(Version version) const
    {
        return std::ranges::count(executor_->statements(), statementOf(version)) > 0;
    }
};

TEST_F(MigrationEngineTest, AppliesInAscendingOrder)
{
    auto engine = makeEngine();
    auto const report = engine.migrate(makeTestResources({5, 3, 1, 2}));
    ASSERT_TRUE(report.has_value()) << report.error().error;

    EXPECT_EQ(report->applied, (std::vector<Version>{1, 2, 3, 5}));
    EXPECT_TRUE(report->observed.empty());
    EXPECT_EQ(
        executor_->statements(), (std::vector<std::string>{statementOf(1), statementOf(2), statementOf(3), statementOf(5)})
    );
    EXPECT_EQ(store_->recordedVersions(), (std::vector<Version>{1, 2, 3, 5}));
    EXPECT_FALSE(store_->lockOwner().has_value());
    EXPECT_EQ(engine.state(), MigrationEngine::State::Done);

    // version 1 bootstraps without the lock; the lease is extended before each of the others
    EXPECT_EQ(store_->renewals(), 3u);
}

TEST_F(MigrationEngineTest, AppliedVersionsMatchRecords)
{
    EXPECT_EQ(store_->getAppliedVersions().error().kind, MigrationError::Kind::TrackingStoreMissing);

    auto engine = makeEngine();
    ASSERT_TRUE(engine.migrate(makeTestResources({1, 4, 2})).has_value());

    auto const versions = store_->getAppliedVersions();
    ASSERT_TRUE(versions.has_value());
    EXPECT_EQ(*versions, (std::set<Version>{1, 2, 4}));
}

TEST_F(MigrationEngineTest, TrackingTableThenBooks)
{
    auto const resources = resourcesOf({
        makeTestScript(kINITIALIZE_VERSION),
        makeStatementScript(2, "create books", {"CREATE TABLE books (isbn text PRIMARY KEY, title text)"}),
    });

    auto first = makeEngine();
    auto const firstReport = first.migrate(resources);
    ASSERT_TRUE(firstReport.has_value()) << firstReport.error().error;
    EXPECT_EQ(firstReport->applied, (std::vector<Version>{1, 2}));

    auto second = makeEngine();
    auto const secondReport = second.migrate(resources);
    ASSERT_TRUE(secondReport.has_value()) << secondReport.error().error;
    EXPECT_TRUE(secondReport->applied.empty());
    EXPECT_TRUE(secondReport->observed.empty());
    EXPECT_EQ(executor_->statements().size(), 2u);
}

TEST_F(MigrationEngineTest, SecondRunAppliesNothing)
{
    auto const resources = makeTestResources({1, 2, 3, 4});
    auto engine = makeEngine();

    ASSERT_TRUE(engine.migrate(resources).has_value());
    auto const statementsAfterFirstRun = executor_->statements();

    auto const report = engine.migrate(resources);
    ASSERT_TRUE(report.has_value()) << report.error().error;
    EXPECT_TRUE(report->applied.empty());
    EXPECT_EQ(executor_->statements(), statementsAfterFirstRun);
}

TEST_F(MigrationEngineTest, ConcurrentEnginesApplyEachVersionOnce)
{
    auto const resources = makeTestResources({1, 2, 3, 4, 5});
    std::optional<std::expected<MigrationReport, MigrationFailure>> results[2];

    {
        std::jthread const first{[&] { results[0] = makeEngine(testSettings("host-a/1")).migrate(resources); }};
        std::jthread const second{[&] { results[1] = makeEngine(testSettings("host-b/2")).migrate(resources); }};
    }

    for (auto const& result : results) {
        ASSERT_TRUE(result.has_value());
        ASSERT_TRUE(result->has_value()) << result->error().error;
    }

    for (Version version = 1; version <= 5; ++version) {
        auto const appliedBy = std::ranges::count_if(results, [version](auto const& result) {
            return std::ranges::count((*result)->applied, version) == 1;
        });
        EXPECT_EQ(appliedBy, 1) << "version " << version;
    }

    // the initialize script may run on both engines; it is idempotent
    for (Version version = 2; version <= 5; ++version)
        EXPECT_EQ(std::ranges::count(executor_->statements(), statementOf(version)), 1) << "version " << version;

    EXPECT_EQ(store_->recordedVersions(), (std::vector<Version>{1, 2, 3, 4, 5}));
    EXPECT_FALSE(store_->lockOwner().has_value());
}

TEST_F(MigrationEngineTest, ThrowingActionStopsRun)
{
    auto const resources = resourcesOf({
        makeTestScript(1),
        MigrationScript{
            .version = 2,
            .description = "broken",
            .action = [](ScriptContext&) { throw std::runtime_error{"cannot build statement"}; }
        },
        makeTestScript(3),
    });

    auto engine = makeEngine();
    auto const result = engine.migrate(resources);
    ASSERT_FALSE(result.has_value());

    EXPECT_EQ(result.error().error.kind, MigrationError::Kind::ExecutionError);
    EXPECT_EQ(result.error().error.version, 2);
    EXPECT_EQ(result.error().applied, (std::vector<Version>{1}));
    EXPECT_EQ(result.error().lastAppliedVersion, 1);
    EXPECT_EQ(store_->recordedVersions(), (std::vector<Version>{1}));
    EXPECT_FALSE(executed(3));
    EXPECT_EQ(engine.state(), MigrationEngine::State::Failed);
    EXPECT_FALSE(store_->lockOwner().has_value());
}

TEST_F(MigrationEngineTest, AgreementTimeoutStopsRun)
{
    executor_->failOn(statementOf(2), MigrationError{MigrationError::Kind::AgreementTimeout, "no agreement"});

    auto engine = makeEngine();
    auto const result = engine.migrate(makeTestResources({1, 2, 3}));
    ASSERT_FALSE(result.has_value());

    EXPECT_EQ(result.error().error.kind, MigrationError::Kind::AgreementTimeout);
    EXPECT_EQ(result.error().error.version, 2);
    EXPECT_EQ(result.error().error.failedStatement, 1u);
    EXPECT_EQ(result.error().applied, (std::vector<Version>{1}));
    EXPECT_EQ(store_->recordedVersions(), (std::vector<Version>{1}));
    EXPECT_FALSE(executed(3));
}

TEST_F(MigrationEngineTest, PartialFailureOnSecondStatement)
{
    executor_->failOn("ALTER TABLE books ADD year int", MigrationError{MigrationError::Kind::ExecutionError, "invalid"});
    auto const resources = resourcesOf({
        makeTestScript(1),
        makeStatementScript(2, "books", {"CREATE TABLE books (isbn text PRIMARY KEY)", "ALTER TABLE books ADD year int"}),
        makeTestScript(3),
    });

    auto engine = makeEngine();
    auto const result = engine.migrate(resources);
    ASSERT_FALSE(result.has_value());

    auto const& error = result.error().error;
    EXPECT_EQ(error.kind, MigrationError::Kind::PartialMigrationFailure);
    EXPECT_EQ(error.cause, MigrationError::Kind::ExecutionError);
    EXPECT_EQ(error.version, 2);
    EXPECT_EQ(error.failedStatement, 2u);
    EXPECT_EQ(error.lastSuccessfulStatement, 1u);
    EXPECT_EQ(store_->recordedVersions(), (std::vector<Version>{1}));
    EXPECT_FALSE(executed(3));
}

TEST_F(MigrationEngineTest, MissingStoreWithoutInitializeScript)
{
    auto engine = makeEngine();
    auto const result = engine.migrate(makeTestResources({2, 3}));
    ASSERT_FALSE(result.has_value());

    EXPECT_EQ(result.error().error.kind, MigrationError::Kind::TrackingStoreMissing);
    EXPECT_TRUE(executor_->statements().empty());
    EXPECT_FALSE(result.error().lastAppliedVersion.has_value());
}

TEST_F(MigrationEngineTest, EmptyRegistryOnExistingStore)
{
    store_->createTable();
    auto engine = makeEngine();

    auto const report = engine.migrate(makeTestResources({}));
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->applied.empty());
}

TEST_F(MigrationEngineTest, NothingPendingDoesNotTakeLock)
{
    seed({makeTestScript(1), makeTestScript(2)});
    store_->setLockOwner("someone/else");

    auto engine = makeEngine();
    auto const report = engine.migrate(makeTestResources({1, 2}));
    ASSERT_TRUE(report.has_value()) << report.error().error;
    EXPECT_TRUE(report->applied.empty());
    EXPECT_EQ(store_->lockOwner(), "someone/else");
}

TEST_F(MigrationEngineTest, LockHeldByAnotherApplier)
{
    seed({makeTestScript(1)});
    store_->setLockOwner("someone/else");

    auto settings = testSettings();
    settings.lockTimeout = std::chrono::milliseconds{20};
    auto engine = makeEngine(settings);

    auto const result = engine.migrate(makeTestResources({1, 2}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, MigrationError::Kind::LockTimeout);
    EXPECT_EQ(result.error().lastAppliedVersion, 1);
    EXPECT_TRUE(executor_->statements().empty());
    EXPECT_EQ(store_->lockOwner(), "someone/else");
}

TEST_F(MigrationEngineTest, ChecksumMismatch)
{
    auto changed = makeTestScript(2);
    changed.checksum = "deadbeef";
    seed({makeTestScript(1), changed});

    auto engine = makeEngine();
    auto const result = engine.migrate(makeTestResources({1, 2, 3}));
    ASSERT_FALSE(result.has_value());

    EXPECT_EQ(result.error().error.kind, MigrationError::Kind::ChecksumMismatch);
    EXPECT_EQ(result.error().error.version, 2);
    EXPECT_TRUE(executor_->statements().empty());
}

TEST_F(MigrationEngineTest, ChecksumValidationDisabled)
{
    auto changed = makeTestScript(2);
    changed.checksum = "deadbeef";
    seed({makeTestScript(1), changed});

    auto settings = testSettings();
    settings.validateChecksums = false;
    auto engine = makeEngine(settings);

    auto const report = engine.migrate(makeTestResources({1, 2, 3}));
    ASSERT_TRUE(report.has_value()) << report.error().error;
    EXPECT_EQ(report->applied, (std::vector<Version>{3}));
}

TEST_F(MigrationEngineTest, UnregisteredAppliedVersionIsTolerated)
{
    seed({makeTestScript(1), makeTestScript(7)});

    auto engine = makeEngine();
    auto const report = engine.migrate(makeTestResources({1, 2}));
    ASSERT_TRUE(report.has_value()) << report.error().error;
    EXPECT_EQ(report->applied, (std::vector<Version>{2}));
}

TEST_F(MigrationEngineTest, CancelledBeforeApplying)
{
    seed({makeTestScript(1)});
    std::stop_source stopSource;
    stopSource.request_stop();

    auto engine = makeEngine();
    auto const result = engine.migrate(makeTestResources({1, 2}), stopSource.get_token());
    ASSERT_FALSE(result.has_value());

    EXPECT_EQ(result.error().error.kind, MigrationError::Kind::Cancelled);
    EXPECT_TRUE(executor_->statements().empty());
    EXPECT_FALSE(store_->lockOwner().has_value());
}

TEST_F(MigrationEngineTest, CancelledBetweenScripts)
{
    seed({makeTestScript(1)});
    std::stop_source stopSource;

    auto stopping = makeTestScript(2);
    stopping.action = [&stopSource, inner = stopping.action](ScriptContext& ctx) {
        inner(ctx);
        stopSource.request_stop();
    };

    auto engine = makeEngine();
    auto const result =
        engine.migrate(resourcesOf({makeTestScript(1), stopping, makeTestScript(3)}), stopSource.get_token());
    ASSERT_FALSE(result.has_value());

    EXPECT_EQ(result.error().error.kind, MigrationError::Kind::Cancelled);
    EXPECT_EQ(result.error().applied, (std::vector<Version>{2}));
    EXPECT_EQ(result.error().lastAppliedVersion, 2);
    EXPECT_EQ(store_->recordedVersions(), (std::vector<Version>{1, 2}));
    EXPECT_FALSE(executed(3));
}

TEST_F(MigrationEngineTest, RunTimeoutCancelsBetweenScripts)
{
    seed({makeTestScript(1)});

    auto slow = makeTestScript(2);
    slow.action = [inner = slow.action](ScriptContext& ctx) {
        inner(ctx);
        std::this_thread::sleep_for(std::chrono::milliseconds{60});
    };

    auto settings = testSettings();
    settings.runTimeout = std::chrono::milliseconds{50};
    auto engine = makeEngine(settings);

    auto const result = engine.migrate(resourcesOf({makeTestScript(1), slow, makeTestScript(3)}));
    ASSERT_FALSE(result.has_value());

    EXPECT_EQ(result.error().error.kind, MigrationError::Kind::Cancelled);
    EXPECT_EQ(result.error().applied, (std::vector<Version>{2}));
    EXPECT_FALSE(executed(3));
}

TEST_F(MigrationEngineTest, ExpiredLeaseStopsBeforeNextScript)
{
    seed({makeTestScript(1)});

    auto slow = makeTestScript(2);
    slow.action = [this](ScriptContext& context) {
        context.execute(statementOf(2));
        // the lease runs out while this script waits for agreement and another applier takes it
        store_->expireLock();
        store_->setLockOwner("other/owner");
    };

    auto engine = makeEngine();
    auto const result = engine.migrate(resourcesOf({makeTestScript(1), std::move(slow), makeTestScript(3)}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, MigrationError::Kind::LockLost);
    EXPECT_EQ(result.error().error.version, 3);
    EXPECT_EQ(result.error().applied, (std::vector<Version>{2}));
    EXPECT_EQ(result.error().lastAppliedVersion, 2);
    EXPECT_FALSE(executed(3));
    EXPECT_EQ(store_->recordedVersions(), (std::vector<Version>{1, 2}));
    EXPECT_EQ(store_->lockOwner(), "other/owner");
}

TEST(MigrationEngineStateTest, StateToString)
{
    EXPECT_STREQ(MigrationEngine::stateToString(MigrationEngine::State::Init), "INIT");
    EXPECT_STREQ(MigrationEngine::stateToString(MigrationEngine::State::LoadingState), "LOADING_STATE");
    EXPECT_STREQ(MigrationEngine::stateToString(MigrationEngine::State::ComputingPending), "COMPUTING_PENDING");
    EXPECT_STREQ(MigrationEngine::stateToString(MigrationEngine::State::Applying), "APPLYING");
    EXPECT_STREQ(MigrationEngine::stateToString(MigrationEngine::State::Done), "DONE");
    EXPECT_STREQ(MigrationEngine::stateToString(MigrationEngine::State::Failed), "FAILED");
}

TEST(EngineSettingsTest, MakeFromConfig)
{
    auto& config = util::config::getCassmigConfig();
    auto const errors = config.parse(util::config::ConfigFileJson{boost::json::parse(R"json({
        "migration": {"lock_ttl": 90, "lock_timeout": 15, "lock_poll_interval": 250, "run_timeout": 600,
                      "validate_checksums": false}
    })json")
                                                                       .as_object()});
    ASSERT_FALSE(errors.has_value());

    auto const settings = EngineSettings::make(config.getObject("migration"));
    EXPECT_EQ(settings.lockTtl, std::chrono::seconds{90});
    EXPECT_EQ(settings.lockTimeout, std::chrono::seconds{15});
    EXPECT_EQ(settings.lockPollInterval, std::chrono::milliseconds{250});
    EXPECT_EQ(settings.runTimeout, std::chrono::milliseconds{600'000});
    EXPECT_FALSE(settings.validateChecksums);
    EXPECT_FALSE(settings.ownerId.empty());
    EXPECT_NE(settings.ownerId, EngineSettings::make(config.getObject("migration")).ownerId);
}

// Failure paths of the tracking store that the in-memory store can't produce
struct MigrationEngineMockTest : MockMigrationTest {
protected:
    MigrationEngine engine_{store_, executor_, testSettings()};

    MigrationEngineMockTest()
    {
        ON_CALL(*executor_, executeWithAgreement).WillByDefault(Return(std::expected<void, MigrationError>{}));
        ON_CALL(*store_, tryAcquireLock).WillByDefault(Return(true));
        ON_CALL(*store_, renewLock).WillByDefault(Return(true));
        ON_CALL(*store_, releaseLock).WillByDefault(Return(std::expected<void, MigrationError>{}));
    }
};

TEST_F(MigrationEngineMockTest, ConnectivityErrorIsPropagated)
{
    EXPECT_CALL(*store_, getAppliedRecords)
        .WillOnce(Return(std::unexpected{MigrationError{MigrationError::Kind::Connectivity, "no hosts available"}}));
    EXPECT_CALL(*executor_, executeWithAgreement).Times(0);

    auto const result = engine_.migrate(makeTestResources({1, 2}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, MigrationError::Kind::Connectivity);
    EXPECT_EQ(result.error().error.message, "no hosts available");
}

TEST_F(MigrationEngineMockTest, BootstrapObservedFromAnotherApplier)
{
    auto const init = makeTestScript(kINITIALIZE_VERSION);
    EXPECT_CALL(*store_, getAppliedRecords)
        .WillOnce(Return(std::unexpected{MigrationError{MigrationError::Kind::TrackingStoreMissing, "missing"}}))
        .WillOnce(Return(std::vector<TrackingRecord>{recordOf(init)}));
    EXPECT_CALL(*executor_, executeWithAgreement(statementOf(kINITIALIZE_VERSION)));
    EXPECT_CALL(*store_, recordApplied(testing::Field(&TrackingRecord::version, kINITIALIZE_VERSION)))
        .WillOnce(Return(false));
    EXPECT_CALL(*store_, tryAcquireLock).Times(0);

    auto const report = engine_.migrate(makeTestResources({1}));
    ASSERT_TRUE(report.has_value()) << report.error().error;
    EXPECT_TRUE(report->applied.empty());
    EXPECT_EQ(report->observed, (std::vector<Version>{1}));
}

TEST_F(MigrationEngineMockTest, TrackingWriteFailure)
{
    EXPECT_CALL(*store_, getAppliedRecords).WillRepeatedly(Return(std::vector<TrackingRecord>{}));
    EXPECT_CALL(*store_, recordApplied)
        .WillOnce(Return(std::unexpected{MigrationError{MigrationError::Kind::TrackingWriteFailed, "timeout"}}));
    EXPECT_CALL(*store_, releaseLock("test/owner"));

    auto const result = engine_.migrate(makeTestResources({2, 3}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, MigrationError::Kind::TrackingWriteFailed);
    EXPECT_EQ(result.error().error.version, 2);
    EXPECT_TRUE(result.error().applied.empty());
}

TEST_F(MigrationEngineMockTest, LostRecordUnderLock)
{
    EXPECT_CALL(*store_, getAppliedRecords).WillRepeatedly(Return(std::vector<TrackingRecord>{}));
    EXPECT_CALL(*store_, recordApplied).WillOnce(Return(false));
    EXPECT_CALL(*executor_, executeWithAgreement(statementOf(3))).Times(0);

    auto const result = engine_.migrate(makeTestResources({2, 3}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, MigrationError::Kind::ConcurrentApplication);
    EXPECT_EQ(result.error().error.version, 2);
}

TEST_F(MigrationEngineMockTest, AppliedWhileWaitingForLock)
{
    auto const script = makeTestScript(2);
    EXPECT_CALL(*store_, getAppliedRecords)
        .WillOnce(Return(std::vector<TrackingRecord>{}))
        .WillOnce(Return(std::vector<TrackingRecord>{recordOf(script)}));
    EXPECT_CALL(*executor_, executeWithAgreement).Times(0);
    EXPECT_CALL(*store_, recordApplied).Times(0);

    auto const report = engine_.migrate(makeTestResources({2}));
    ASSERT_TRUE(report.has_value()) << report.error().error;
    EXPECT_TRUE(report->applied.empty());
}

TEST_F(MigrationEngineMockTest, LeaseLostBeforeFirstScript)
{
    EXPECT_CALL(*store_, getAppliedRecords).WillRepeatedly(Return(std::vector<TrackingRecord>{}));
    EXPECT_CALL(*store_, renewLock("test/owner", std::chrono::seconds{30})).WillOnce(Return(false));
    EXPECT_CALL(*executor_, executeWithAgreement).Times(0);
    EXPECT_CALL(*store_, recordApplied).Times(0);

    auto const result = engine_.migrate(makeTestResources({2, 3}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, MigrationError::Kind::LockLost);
    EXPECT_EQ(result.error().error.version, 2);
    EXPECT_TRUE(result.error().applied.empty());
}

TEST_F(MigrationEngineMockTest, LeaseRenewalErrorStopsRun)
{
    EXPECT_CALL(*store_, getAppliedRecords).WillRepeatedly(Return(std::vector<TrackingRecord>{}));
    EXPECT_CALL(*store_, renewLock)
        .WillOnce(Return(true))
        .WillOnce(Return(std::unexpected{MigrationError{MigrationError::Kind::Connectivity, "timed out"}}));
    EXPECT_CALL(*store_, recordApplied).WillOnce(Return(true));
    EXPECT_CALL(*executor_, executeWithAgreement(statementOf(3))).Times(0);

    auto const result = engine_.migrate(makeTestResources({2, 3}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, MigrationError::Kind::Connectivity);
    EXPECT_EQ(result.error().applied, (std::vector<Version>{2}));
}
