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

#include "data/cassandra/Handle.hpp"

#include "data/cassandra/Types.hpp"

#include <cassandra.h>

#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>

namespace data::cassandra {

Handle::Handle(Settings clusterSettings) : cluster_{clusterSettings}
{
}

Handle::Handle(std::string_view contactPoints) : Handle{Settings::defaultSettings().withContactPoints(contactPoints)}
{
}

Handle::~Handle()
{
    [[maybe_unused]] auto _ = disconnect();  // attempt to disconnect
}

Handle::FutureType
Handle::asyncConnect() const
{
    return cass_session_connect(session_, cluster_);
}

Handle::MaybeErrorType
Handle::connect() const
{
    return asyncConnect().await();
}

Handle::FutureType
Handle::asyncConnect(std::string_view keyspace) const
{
    return cass_session_connect_keyspace_n(session_, cluster_, keyspace.data(), keyspace.size());
}

Handle::MaybeErrorType
Handle::connect(std::string_view keyspace) const
{
    return asyncConnect(keyspace).await();
}

Handle::FutureType
Handle::asyncDisconnect() const
{
    return cass_session_close(session_);
}

Handle::MaybeErrorType
Handle::disconnect() const
{
    return asyncDisconnect().await();
}

Handle::MaybeErrorType
Handle::reconnect(std::string_view keyspace) const
{
    if (auto rc = disconnect(); not rc)
        return std::unexpected{CassandraError{
            "Reconnect to keyspace '" + std::string{keyspace} + "' failed: " + rc.error().message(), rc.error().code()
        }};
    return asyncConnect(keyspace).await();
}

Handle::FutureType
Handle::asyncExecute(StatementType const& statement) const
{
    return cass_session_execute(session_, statement);
}

Handle::ResultOrErrorType
Handle::execute(StatementType const& statement) const
{
    return asyncExecute(statement).get();
}

Handle::PreparedStatementType
Handle::prepare(std::string_view query) const
{
    Handle::FutureType const future = cass_session_prepare_n(session_, query.data(), query.size());
    auto const rc = cass_future_error_code(future);
    if (rc == CASS_OK)
        return cass_future_get_prepared(future);

    auto const errMsg = std::string{"Error preparing statement: '"} + std::string{query} + "': " +
        cass_error_desc(rc);
    throw std::runtime_error(errMsg);
}

}  // namespace data::cassandra
