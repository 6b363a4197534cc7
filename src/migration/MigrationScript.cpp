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

#include "migration/MigrationScript.hpp"

#include "migration/MigrationError.hpp"
#include "migration/SchemaAgreementExecutorInterface.hpp"
#include "migration/Types.hpp"

#include <boost/crc.hpp>
#include <fmt/core.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace migration {

ScriptContext::ScriptContext(Version version, SchemaAgreementExecutorInterface& executor)
    : version_{version}, executor_{executor}
{
}

void
ScriptContext::execute(std::string const& statement)
{
    auto const index = executed_ + 1;
    auto res = executor_.get().executeWithAgreement(statement);
    if (res.has_value()) {
        executed_ = index;
        return;
    }

    auto error = res.error().withVersion(version_);
    if (executed_ == 0) {
        error.failedStatement = index;
        throw StatementFailure{std::move(error)};
    }

    auto partial = MigrationError{
        MigrationError::Kind::PartialMigrationFailure,
        fmt::format("statement {} of version {} failed: {}", index, version_, error.message)
    };
    partial.version = version_;
    partial.failedStatement = index;
    partial.lastSuccessfulStatement = executed_;
    partial.cause = error.kind;
    throw StatementFailure{std::move(partial)};
}

std::string
computeChecksum(std::vector<std::string> const& statements)
{
    boost::crc_32_type crc;
    for (auto const& statement : statements) {
        crc.process_bytes(statement.data(), statement.size());
        crc.process_byte('\n');
    }
    return fmt::format("{:08x}", crc.checksum());
}

MigrationScript
makeStatementScript(Version version, std::string description, std::vector<std::string> statements)
{
    auto checksum = computeChecksum(statements);
    return MigrationScript{
        .version = version,
        .description = std::move(description),
        .action =
            [statements = std::move(statements)](ScriptContext& ctx) {
                for (auto const& statement : statements)
                    ctx.execute(statement);
            },
        .checksum = std::move(checksum)
    };
}

}  // namespace migration
