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

#include "migration/DirectoryResourcesProvider.hpp"
#include "migration/MigrationError.hpp"
#include "migration/MigrationScript.hpp"
#include "migration/Types.hpp"
#include "util/LoggerFixtures.hpp"
#include "util/MockSchemaAgreementExecutor.hpp"
#include "util/TmpFile.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <expected>
#include <string>
#include <vector>

using namespace migration;

struct DirectoryResourcesProviderTest : NoLoggerFixture {
protected:
    TmpDir dir_;
    DirectoryResourcesProvider provider_{dir_.path};
};

TEST_F(DirectoryResourcesProviderTest, LoadsScriptsInVersionOrder)
{
    dir_.write("V2__create_books.cql", "CREATE TABLE books (isbn text PRIMARY KEY);");
    dir_.write("V10__add_title.cql", "ALTER TABLE books ADD title text;\nALTER TABLE books ADD year int;");
    dir_.write("V1__init.cql", "CREATE TABLE IF NOT EXISTS schema_migrations (version int PRIMARY KEY);");
    dir_.write("README.md", "not a script");

    auto const resources = provider_.load();
    ASSERT_TRUE(resources.has_value()) << resources.error();

    EXPECT_EQ(resources->versions(), (std::vector<Version>{1, 2, 10}));
    EXPECT_EQ(resources->find(2)->description, "create books");
    EXPECT_EQ(resources->find(10)->description, "add title");
    EXPECT_EQ(
        resources->find(10)->checksum,
        computeChecksum({"ALTER TABLE books ADD title text", "ALTER TABLE books ADD year int"})
    );
}

TEST_F(DirectoryResourcesProviderTest, ScriptActionExecutesFileStatements)
{
    dir_.write("V3__two_statements.cql", "-- books\nCREATE TABLE a (id int PRIMARY KEY);\nDROP TABLE b;\n");

    auto const resources = provider_.load();
    ASSERT_TRUE(resources.has_value()) << resources.error();

    testing::StrictMock<MockSchemaAgreementExecutor> executor;
    testing::InSequence const seq;
    EXPECT_CALL(executor, executeWithAgreement("CREATE TABLE a (id int PRIMARY KEY)"))
        .WillOnce(testing::Return(std::expected<void, MigrationError>{}));
    EXPECT_CALL(executor, executeWithAgreement("DROP TABLE b"))
        .WillOnce(testing::Return(std::expected<void, MigrationError>{}));

    auto const* script = resources->find(3);
    ASSERT_NE(script, nullptr);
    ScriptContext context{script->version, executor};
    script->action(context);
}

TEST_F(DirectoryResourcesProviderTest, EmptyDirectory)
{
    auto const resources = provider_.load();
    ASSERT_TRUE(resources.has_value());
    EXPECT_TRUE(resources->empty());
}

TEST_F(DirectoryResourcesProviderTest, MissingDirectory)
{
    DirectoryResourcesProvider const provider{dir_.path / "missing"};
    auto const resources = provider.load();
    ASSERT_FALSE(resources.has_value());
    EXPECT_EQ(resources.error().kind, MigrationError::Kind::ScriptLoadError);
}

TEST_F(DirectoryResourcesProviderTest, BadFileNames)
{
    for (auto const* name : {"create_books.cql", "V__books.cql", "V2_books.cql", "Vx__books.cql", "V2__.cql"}) {
        TmpDir const dir;
        dir.write(name, "DROP TABLE a;");

        auto const resources = DirectoryResourcesProvider{dir.path}.load();
        ASSERT_FALSE(resources.has_value()) << name;
        EXPECT_EQ(resources.error().kind, MigrationError::Kind::ScriptLoadError) << name;
    }
}

TEST_F(DirectoryResourcesProviderTest, FileWithoutStatements)
{
    dir_.write("V4__nothing.cql", "-- to be written\n");

    auto const resources = provider_.load();
    ASSERT_FALSE(resources.has_value());
    EXPECT_EQ(resources.error().kind, MigrationError::Kind::ScriptLoadError);
}

TEST_F(DirectoryResourcesProviderTest, DuplicateVersion)
{
    dir_.write("V2__books.cql", "DROP TABLE a;");
    dir_.write("V02__authors.cql", "DROP TABLE b;");

    auto const resources = provider_.load();
    ASSERT_FALSE(resources.has_value());
    EXPECT_EQ(resources.error().kind, MigrationError::Kind::DuplicateVersion);
    EXPECT_EQ(resources.error().version, 2);
}
