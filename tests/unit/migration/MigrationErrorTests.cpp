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

#include <gtest/gtest.h>

#include <sstream>

using namespace migration;

TEST(MigrationErrorTest, KindToString)
{
    EXPECT_STREQ(MigrationError::kindToString(MigrationError::Kind::Connectivity), "Connectivity");
    EXPECT_STREQ(MigrationError::kindToString(MigrationError::Kind::AgreementTimeout), "AgreementTimeout");
    EXPECT_STREQ(
        MigrationError::kindToString(MigrationError::Kind::PartialMigrationFailure), "PartialMigrationFailure"
    );
    EXPECT_STREQ(MigrationError::kindToString(MigrationError::Kind::LockLost), "LockLost");
    EXPECT_STREQ(MigrationError::kindToString(MigrationError::Kind::ScriptLoadError), "ScriptLoadError");
}

TEST(MigrationErrorTest, ToStringWithoutDetails)
{
    MigrationError const error{MigrationError::Kind::LockTimeout, "lock held"};
    EXPECT_EQ(error.toString(), "LockTimeout: lock held");
}

TEST(MigrationErrorTest, ToStringWithVersion)
{
    auto const error = MigrationError{MigrationError::Kind::ExecutionError, "bad query"}.withVersion(7);
    EXPECT_EQ(error.version, 7);
    EXPECT_EQ(error.toString(), "ExecutionError [version 7]: bad query");
}

TEST(MigrationErrorTest, ToStringPartialFailure)
{
    MigrationError error{MigrationError::Kind::PartialMigrationFailure, "statement 2 failed"};
    error.version = 3;
    error.failedStatement = 2;
    error.lastSuccessfulStatement = 1;
    error.cause = MigrationError::Kind::AgreementTimeout;

    EXPECT_EQ(
        error.toString(),
        "PartialMigrationFailure [version 3] [statement 2, last successful 1] caused by AgreementTimeout: statement 2 "
        "failed"
    );

    std::stringstream stream;
    stream << error;
    EXPECT_EQ(stream.str(), error.toString());
}

TEST(MigrationErrorTest, WithVersionKeepsOriginal)
{
    MigrationError const error{MigrationError::Kind::Cancelled, "stop"};
    auto const withVersion = error.withVersion(2);

    EXPECT_FALSE(error.version.has_value());
    EXPECT_NE(error, withVersion);
    EXPECT_EQ(withVersion.kind, error.kind);
    EXPECT_EQ(withVersion.message, error.message);
}
