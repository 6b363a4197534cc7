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

#include "migration/MigrationError.hpp"
#include "migration/MigrationScript.hpp"
#include "migration/TrackingRecord.hpp"
#include "migration/Types.hpp"
#include "migration/cassandra/CassandraMigrationTestBase.hpp"
#include "migration/cassandra/CassandraSchemaAgreementExecutor.hpp"
#include "migration/cassandra/CassandraTrackingStore.hpp"
#include "migration/cassandra/InitializeScript.hpp"

#include <fmt/core.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace migration;
using namespace migration::cassandra;

namespace {

TrackingRecord
record(Version version, std::string description)
{
    return TrackingRecord{
        .version = version,
        .description = std::move(description),
        .appliedAt = std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now()),
        .checksum = "0badc0de"
    };
}

}  // namespace

struct CassandraTrackingStoreTest : CassandraMigrationTestBase {
protected:
    std::unique_ptr<CassandraTrackingStore> store_;
    std::unique_ptr<CassandraSchemaAgreementExecutor> executor_;

    void
    SetUp() override
    {
        CassandraMigrationTestBase::SetUp();
        if (HasFatalFailure())
            return;

        store_ = std::make_unique<CassandraTrackingStore>(*handle_, trackingTable());
        executor_ = std::make_unique<CassandraSchemaAgreementExecutor>(
            *handle_,
            CassandraSchemaAgreementExecutor::Settings::make(
                config_.getObject("migration"), config_.getObject("database.cassandra")
            )
        );
    }

    void
    createTrackingTable()
    {
        auto const script = makeInitializeScript(trackingTable());
        ScriptContext context{script.version, *executor_};
        script.action(context);
    }
};

TEST_F(CassandraTrackingStoreTest, MissingTable)
{
    auto const records = store_->getAppliedRecords();
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().kind, MigrationError::Kind::TrackingStoreMissing);
}

TEST_F(CassandraTrackingStoreTest, RecordApplied)
{
    createTrackingTable();

    auto const empty = store_->getAppliedRecords();
    ASSERT_TRUE(empty.has_value()) << empty.error();
    EXPECT_TRUE(empty->empty());

    auto const second = record(2, "books");
    auto const first = record(1, "tracking");
    EXPECT_EQ(store_->recordApplied(second), true);
    EXPECT_EQ(store_->recordApplied(first), true);
    EXPECT_EQ(store_->recordApplied(record(2, "books again")), false);

    auto const records = store_->getAppliedRecords();
    ASSERT_TRUE(records.has_value()) << records.error();
    EXPECT_EQ(*records, (std::vector<TrackingRecord>{first, second}));

    auto const versions = store_->getAppliedVersions();
    ASSERT_TRUE(versions.has_value());
    EXPECT_EQ(*versions, (std::set<Version>{1, 2}));
}

TEST_F(CassandraTrackingStoreTest, LockIsExclusive)
{
    createTrackingTable();
    auto const ttl = std::chrono::seconds{60};

    EXPECT_EQ(store_->tryAcquireLock("owner-a", ttl), true);
    EXPECT_EQ(store_->tryAcquireLock("owner-a", ttl), true);
    EXPECT_EQ(store_->tryAcquireLock("owner-b", ttl), false);

    // the lock row is never reported as an applied version
    auto const records = store_->getAppliedRecords();
    ASSERT_TRUE(records.has_value());
    EXPECT_TRUE(records->empty());

    EXPECT_TRUE(store_->releaseLock("owner-b").has_value());
    EXPECT_EQ(store_->tryAcquireLock("owner-b", ttl), false);

    EXPECT_TRUE(store_->releaseLock("owner-a").has_value());
    EXPECT_EQ(store_->tryAcquireLock("owner-b", ttl), true);
    EXPECT_TRUE(store_->releaseLock("owner-b").has_value());
}

TEST_F(CassandraTrackingStoreTest, LockExpires)
{
    createTrackingTable();

    EXPECT_EQ(store_->tryAcquireLock("owner-a", std::chrono::seconds{1}), true);
    std::this_thread::sleep_for(std::chrono::seconds{2});
    EXPECT_EQ(store_->tryAcquireLock("owner-b", std::chrono::seconds{60}), true);
}

TEST_F(CassandraTrackingStoreTest, ExecutorReportsInvalidStatement)
{
    auto const res = executor_->executeWithAgreement("CREATE TABLE missing_parenthesis (id int PRIMARY KEY");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, MigrationError::Kind::ExecutionError);
}

TEST_F(CassandraTrackingStoreTest, ExecutorWaitsForAgreement)
{
    auto const res = executor_->executeWithAgreement(
        "CREATE TABLE IF NOT EXISTS books (isbn text PRIMARY KEY, title text)"
    );
    ASSERT_TRUE(res.has_value()) << res.error();
    EXPECT_TRUE(handle_->execute("SELECT isbn FROM books").has_value());
}

TEST_F(CassandraTrackingStoreTest, LockRenewalOutlivesOriginalTtl)
{
    createTrackingTable();

    EXPECT_EQ(store_->tryAcquireLock("owner-a", std::chrono::seconds{2}), true);
    EXPECT_EQ(store_->renewLock("owner-b", std::chrono::seconds{60}), false);
    EXPECT_EQ(store_->renewLock("owner-a", std::chrono::seconds{60}), true);

    std::this_thread::sleep_for(std::chrono::seconds{3});
    EXPECT_EQ(store_->tryAcquireLock("owner-b", std::chrono::seconds{60}), false);
    EXPECT_TRUE(store_->releaseLock("owner-a").has_value());
}

TEST_F(CassandraTrackingStoreTest, RenewalAfterExpiryFails)
{
    createTrackingTable();

    EXPECT_EQ(store_->tryAcquireLock("owner-a", std::chrono::seconds{1}), true);
    std::this_thread::sleep_for(std::chrono::seconds{2});
    EXPECT_EQ(store_->tryAcquireLock("owner-b", std::chrono::seconds{60}), true);
    EXPECT_EQ(store_->renewLock("owner-a", std::chrono::seconds{60}), false);
}

TEST_F(CassandraTrackingStoreTest, UnexpectedTableLayout)
{
    auto const created = executor_->executeWithAgreement(fmt::format(
        "CREATE TABLE {} (version text PRIMARY KEY, description text, applied_at timestamp, checksum text)",
        trackingTable()
    ));
    ASSERT_TRUE(created.has_value()) << created.error();
    auto const inserted =
        handle_->execute(fmt::format("INSERT INTO {} (version, description) VALUES ('1', 'books')", trackingTable()));
    ASSERT_TRUE(inserted.has_value()) << inserted.error();

    auto const records = store_->getAppliedRecords();
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().kind, MigrationError::Kind::ExecutionError);
}
