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

#include <expected>
#include <string>

namespace migration {

/**
 * @brief Issues schema changing statements and waits until the cluster agrees on the resulting schema
 */
struct SchemaAgreementExecutorInterface {
    virtual ~SchemaAgreementExecutorInterface() = default;

    /**
     * @brief Execute the statement and block until every reachable node reports the same schema version.
     *
     * @param statement The CQL statement
     * @return Nothing on success; AgreementTimeout, ExecutionError or Connectivity error otherwise
     */
    virtual std::expected<void, MigrationError>
    executeWithAgreement(std::string const& statement) = 0;
};

}  // namespace migration
