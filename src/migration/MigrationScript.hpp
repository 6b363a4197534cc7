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
#include "migration/SchemaAgreementExecutorInterface.hpp"
#include "migration/Types.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace migration {

/**
 * @brief Thrown from @ref ScriptContext::execute when a statement did not succeed
 */
class StatementFailure : public std::runtime_error {
    MigrationError error_;

public:
    explicit StatementFailure(MigrationError error) : std::runtime_error{error.toString()}, error_{std::move(error)}
    {
    }

    [[nodiscard]] MigrationError const&
    error() const
    {
        return error_;
    }
};

/**
 * @brief The handle a script action uses to change the schema.
 *
 * Every statement is routed through the schema agreement executor, so the next statement is only issued once the
 * cluster agreed on the schema produced by the previous one.
 */
class ScriptContext {
    Version version_;
    std::reference_wrapper<SchemaAgreementExecutorInterface> executor_;
    std::size_t executed_ = 0;

public:
    ScriptContext(Version version, SchemaAgreementExecutorInterface& executor);

    /**
     * @brief Execute one statement and wait for schema agreement
     *
     * @throws StatementFailure with the error of the statement. Failures after the first statement are reported as
     * PartialMigrationFailure carrying both statement indices.
     *
     * @param statement The CQL statement
     */
    void
    execute(std::string const& statement);

    /**
     * @return The number of statements that completed successfully so far
     */
    [[nodiscard]] std::size_t
    executedStatements() const
    {
        return executed_;
    }

    [[nodiscard]] Version
    version() const
    {
        return version_;
    }
};

/**
 * @brief A versioned unit of schema change
 */
struct MigrationScript {
    using Action = std::function<void(ScriptContext&)>;

    Version version;
    std::string description;
    Action action;
    std::optional<std::string> checksum = std::nullopt;
};

/**
 * @brief Compute the checksum of a list of statements
 *
 * @param statements The statements
 * @return CRC-32 of the statements as 8 lowercase hex digits
 */
[[nodiscard]] std::string
computeChecksum(std::vector<std::string> const& statements);

/**
 * @brief Create a script executing the given statements in order
 *
 * @param version The version of the script
 * @param description The description
 * @param statements The statements to execute
 * @return The script; its checksum is computed from the statements
 */
[[nodiscard]] MigrationScript
makeStatementScript(Version version, std::string description, std::vector<std::string> statements);

}  // namespace migration
