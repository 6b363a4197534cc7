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
#include "migration/impl/AgreementWaiter.hpp"
#include "util/LoggerFixtures.hpp"
#include "util/log/Logger.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <vector>

using namespace migration;
using namespace migration::impl;
using testing::Return;

namespace {

using FetchResult = std::expected<std::vector<NodeSchemaVersion>, MigrationError>;
using VersionResult = std::expected<std::optional<std::string>, MigrationError>;
using PeersResult = std::expected<std::vector<std::string>, MigrationError>;

std::vector<NodeSchemaVersion> const kAGREED = {{"10.0.0.1", "a"}, {"10.0.0.2", "a"}, {"10.0.0.3", "a"}};
std::vector<NodeSchemaVersion> const kDISAGREED = {{"10.0.0.1", "a"}, {"10.0.0.2", "b"}};

}  // namespace

TEST(IsInAgreementTest, SameVersion)
{
    EXPECT_TRUE(isInAgreement(kAGREED));
    EXPECT_FALSE(isInAgreement(kDISAGREED));
}

TEST(IsInAgreementTest, NodesWithoutVersionAreIgnored)
{
    EXPECT_TRUE(isInAgreement({{"10.0.0.1", "a"}, {"10.0.0.2", std::nullopt}, {"10.0.0.3", "a"}}));
    EXPECT_TRUE(isInAgreement({{"10.0.0.1", std::nullopt}}));
    EXPECT_TRUE(isInAgreement({}));
    EXPECT_FALSE(isInAgreement({{"10.0.0.1", std::nullopt}, {"10.0.0.2", "a"}, {"10.0.0.3", "b"}}));
}

struct AgreementWaiterTest : NoLoggerFixture {
protected:
    util::Logger log_{"Migration"};
    testing::StrictMock<testing::MockFunction<FetchResult()>> fetcher_;

    std::expected<void, MigrationError>
    wait(std::chrono::milliseconds timeout)
    {
        return waitForAgreement(fetcher_.AsStdFunction(), timeout, std::chrono::milliseconds{1}, log_);
    }
};

TEST_F(AgreementWaiterTest, AgreementOnFirstPoll)
{
    EXPECT_CALL(fetcher_, Call).WillOnce(Return(FetchResult{kAGREED}));
    EXPECT_TRUE(wait(std::chrono::seconds{1}).has_value());
}

TEST_F(AgreementWaiterTest, WaitsUntilVersionsConverge)
{
    EXPECT_CALL(fetcher_, Call)
        .WillOnce(Return(FetchResult{kDISAGREED}))
        .WillOnce(Return(FetchResult{kDISAGREED}))
        .WillOnce(Return(FetchResult{kAGREED}));
    EXPECT_TRUE(wait(std::chrono::seconds{1}).has_value());
}

TEST_F(AgreementWaiterTest, PollErrorsDoNotAbort)
{
    EXPECT_CALL(fetcher_, Call)
        .WillOnce(Return(FetchResult{std::unexpected{MigrationError{MigrationError::Kind::Connectivity, "lost"}}}))
        .WillOnce(Return(FetchResult{kAGREED}));
    EXPECT_TRUE(wait(std::chrono::seconds{1}).has_value());
}

TEST_F(AgreementWaiterTest, TimesOutWithoutAgreement)
{
    EXPECT_CALL(fetcher_, Call).WillRepeatedly(Return(FetchResult{kDISAGREED}));

    auto const res = wait(std::chrono::milliseconds{20});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, MigrationError::Kind::AgreementTimeout);
    EXPECT_NE(res.error().message.find("schema versions differ"), std::string::npos);
}

TEST_F(AgreementWaiterTest, TimesOutOnPersistentErrors)
{
    EXPECT_CALL(fetcher_, Call)
        .WillRepeatedly(Return(FetchResult{std::unexpected{MigrationError{MigrationError::Kind::Connectivity, "lost"}}}
        ));

    auto const res = wait(std::chrono::milliseconds{20});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, MigrationError::Kind::AgreementTimeout);
    EXPECT_NE(res.error().message.find("lost"), std::string::npos);
}

struct CollectSchemaVersionsTest : NoLoggerFixture {
protected:
    util::Logger log_{"Migration"};
    testing::StrictMock<testing::MockFunction<VersionResult(std::optional<std::string> const&)>> readVersion_;
    testing::StrictMock<testing::MockFunction<PeersResult()>> readPeers_;

    FetchResult
    collect()
    {
        return collectSchemaVersions(readVersion_.AsStdFunction(), readPeers_.AsStdFunction(), log_);
    }

    static VersionResult
    unreachable()
    {
        return std::unexpected{MigrationError{MigrationError::Kind::Connectivity, "no hosts available"}};
    }
};

TEST_F(CollectSchemaVersionsTest, EveryPeerReportsItsOwnVersion)
{
    // the coordinator lists both peers; only asking the lagging peer itself reveals it is behind
    EXPECT_CALL(readVersion_, Call(std::optional<std::string>{})).WillOnce(Return(VersionResult{"a"}));
    EXPECT_CALL(readPeers_, Call).WillOnce(Return(PeersResult{std::vector<std::string>{"10.0.0.2", "10.0.0.3"}}));
    EXPECT_CALL(readVersion_, Call(std::optional<std::string>{"10.0.0.2"})).WillOnce(Return(VersionResult{"a"}));
    EXPECT_CALL(readVersion_, Call(std::optional<std::string>{"10.0.0.3"})).WillOnce(Return(VersionResult{"b"}));

    auto const nodes = collect();
    ASSERT_TRUE(nodes.has_value());
    ASSERT_EQ(nodes->size(), 3u);
    EXPECT_EQ(nodes->at(0).node, "coordinator");
    EXPECT_EQ(nodes->at(2).node, "10.0.0.3");
    EXPECT_EQ(nodes->at(2).schemaVersion, "b");
    EXPECT_FALSE(isInAgreement(*nodes));
}

TEST_F(CollectSchemaVersionsTest, UnreachablePeerIsLeftOut)
{
    EXPECT_CALL(readVersion_, Call(std::optional<std::string>{})).WillOnce(Return(VersionResult{"a"}));
    EXPECT_CALL(readPeers_, Call).WillOnce(Return(PeersResult{std::vector<std::string>{"10.0.0.2", "10.0.0.3"}}));
    EXPECT_CALL(readVersion_, Call(std::optional<std::string>{"10.0.0.2"})).WillOnce(Return(unreachable()));
    EXPECT_CALL(readVersion_, Call(std::optional<std::string>{"10.0.0.3"})).WillOnce(Return(VersionResult{"a"}));

    auto const nodes = collect();
    ASSERT_TRUE(nodes.has_value());
    ASSERT_EQ(nodes->size(), 2u);
    EXPECT_EQ(nodes->at(1).node, "10.0.0.3");
    EXPECT_TRUE(isInAgreement(*nodes));
}

TEST_F(CollectSchemaVersionsTest, PeerQueryErrorIsReported)
{
    EXPECT_CALL(readVersion_, Call(std::optional<std::string>{})).WillOnce(Return(VersionResult{"a"}));
    EXPECT_CALL(readPeers_, Call).WillOnce(Return(PeersResult{std::vector<std::string>{"10.0.0.2"}}));
    EXPECT_CALL(readVersion_, Call(std::optional<std::string>{"10.0.0.2"}))
        .WillOnce(Return(VersionResult{std::unexpected{MigrationError{MigrationError::Kind::ExecutionError, "bad"}}}));

    auto const nodes = collect();
    ASSERT_FALSE(nodes.has_value());
    EXPECT_EQ(nodes.error().kind, MigrationError::Kind::ExecutionError);
}

TEST_F(CollectSchemaVersionsTest, CoordinatorErrorIsReported)
{
    EXPECT_CALL(readVersion_, Call(std::optional<std::string>{})).WillOnce(Return(unreachable()));

    auto const nodes = collect();
    ASSERT_FALSE(nodes.has_value());
    EXPECT_EQ(nodes.error().kind, MigrationError::Kind::Connectivity);
}

TEST_F(CollectSchemaVersionsTest, WaitsForLaggingPeer)
{
    EXPECT_CALL(readVersion_, Call(std::optional<std::string>{})).WillRepeatedly(Return(VersionResult{"a"}));
    EXPECT_CALL(readPeers_, Call).WillRepeatedly(Return(PeersResult{std::vector<std::string>{"10.0.0.2"}}));
    EXPECT_CALL(readVersion_, Call(std::optional<std::string>{"10.0.0.2"}))
        .WillOnce(Return(VersionResult{"b"}))
        .WillOnce(Return(VersionResult{"b"}))
        .WillOnce(Return(VersionResult{"a"}));

    auto const res = waitForAgreement(
        [this]() { return collect(); }, std::chrono::seconds{1}, std::chrono::milliseconds{1}, log_
    );
    EXPECT_TRUE(res.has_value());
}

