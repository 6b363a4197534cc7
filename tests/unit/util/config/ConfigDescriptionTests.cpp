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

#include "util/config/ConfigDefinition.hpp"
#include "util/config/ConfigDescription.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace util::config;

TEST(ConfigDescriptionTest, EveryKeyIsDescribed)
{
    for (auto const& [key, _] : getCassmigConfig())
        EXPECT_TRUE(CassmigConfigDescription::contains(key)) << key << " has no description";
}

TEST(ConfigDescriptionTest, GetDescription)
{
    EXPECT_FALSE(CassmigConfigDescription::get("migration.tracking_table").empty());
    EXPECT_FALSE(CassmigConfigDescription::contains("server.ip"));
}

TEST(ConfigDescriptionTest, WriteMarkdown)
{
    std::stringstream stream;
    CassmigConfigDescription::writeMarkdown(stream);

    auto const markdown = stream.str();
    EXPECT_TRUE(markdown.starts_with("# Configuration keys"));
    EXPECT_NE(markdown.find("### database.cassandra.contact_points"), std::string::npos);
    EXPECT_NE(markdown.find("### migration.agreement_timeout"), std::string::npos);
}
