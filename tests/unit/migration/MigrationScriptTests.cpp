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
#include "util/MockSchemaAgreementExecutor.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <expected>
#include <string>

using namespace migration;
using testing::Return;

struct ScriptContextTest : testing::Test {
protected:
    testing::StrictMock<MockSchemaAgreementExecutor> executor_;
    ScriptContext context_{4, executor_};
};

TEST_F(ScriptContextTest, CountsExecutedStatements)
{
    EXPECT_CALL(executor_, executeWithAgreement("A")).WillOnce(Return(std::expected<void, MigrationError>{}));
    EXPECT_CALL(executor_, executeWithAgreement("B")).WillOnce(Return(std::expected<void, MigrationError>{}));

    context_.execute("A");
    context_.execute("B");

    EXPECT_EQ(context_.executedStatements(), 2u);
    EXPECT_EQ(context_.version(), 4);
}

TEST_F(ScriptContextTest, FirstStatementFailureKeepsKind)
{
    EXPECT_CALL(executor_, executeWithAgreement("A"))
        .WillOnce(Return(std::unexpected{MigrationError{MigrationError::Kind::AgreementTimeout, "slow"}}));

    try {
        context_.execute("A");
        FAIL() << "StatementFailure expected";
    } catch (StatementFailure const& failure) {
        EXPECT_EQ(failure.error().kind, MigrationError::Kind::AgreementTimeout);
        EXPECT_EQ(failure.error().version, 4);
        EXPECT_EQ(failure.error().failedStatement, 1u);
        EXPECT_FALSE(failure.error().lastSuccessfulStatement.has_value());
    }
    EXPECT_EQ(context_.executedStatements(), 0u);
}

TEST_F(ScriptContextTest, LaterStatementFailureIsPartial)
{
    EXPECT_CALL(executor_, executeWithAgreement("A")).WillOnce(Return(std::expected<void, MigrationError>{}));
    EXPECT_CALL(executor_, executeWithAgreement("B"))
        .WillOnce(Return(std::unexpected{MigrationError{MigrationError::Kind::ExecutionError, "syntax"}}));

    context_.execute("A");
    try {
        context_.execute("B");
        FAIL() << "StatementFailure expected";
    } catch (StatementFailure const& failure) {
        EXPECT_EQ(failure.error().kind, MigrationError::Kind::PartialMigrationFailure);
        EXPECT_EQ(failure.error().cause, MigrationError::Kind::ExecutionError);
        EXPECT_EQ(failure.error().version, 4);
        EXPECT_EQ(failure.error().failedStatement, 2u);
        EXPECT_EQ(failure.error().lastSuccessfulStatement, 1u);
    }
}

TEST(MigrationScriptTest, ChecksumIsStable)
{
    auto const checksum = computeChecksum({"CREATE TABLE a (id int PRIMARY KEY)", "DROP TABLE b"});
    EXPECT_EQ(checksum.size(), 8u);
    EXPECT_EQ(checksum, computeChecksum({"CREATE TABLE a (id int PRIMARY KEY)", "DROP TABLE b"}));
    EXPECT_NE(checksum, computeChecksum({"CREATE TABLE a (id int PRIMARY KEY)"}));
    EXPECT_NE(checksum, computeChecksum({"DROP TABLE b", "CREATE TABLE a (id int PRIMARY KEY)"}));
}

TEST(MigrationScriptTest, ChecksumKnownValue)
{
    // every statement is terminated by a newline before hashing
    EXPECT_EQ(computeChecksum({}), "00000000");
    EXPECT_EQ(computeChecksum({"123456789"}), "e0117757");
}

TEST(MigrationScriptTest, StatementScriptExecutesInOrder)
{
    testing::StrictMock<MockSchemaAgreementExecutor> executor;
    testing::InSequence const seq;
    EXPECT_CALL(executor, executeWithAgreement("first")).WillOnce(Return(std::expected<void, MigrationError>{}));
    EXPECT_CALL(executor, executeWithAgreement("second")).WillOnce(Return(std::expected<void, MigrationError>{}));

    auto const script = makeStatementScript(2, "two statements", {"first", "second"});
    EXPECT_EQ(script.version, 2);
    EXPECT_EQ(script.description, "two statements");
    EXPECT_EQ(script.checksum, computeChecksum({"first", "second"}));

    ScriptContext context{script.version, executor};
    script.action(context);
    EXPECT_EQ(context.executedStatements(), 2u);
}
