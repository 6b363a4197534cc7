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

#include "data/cassandra/Error.hpp"
#include "data/cassandra/Types.hpp"
#include "data/cassandra/impl/Cluster.hpp"
#include "data/cassandra/impl/Future.hpp"
#include "data/cassandra/impl/ManagedObject.hpp"
#include "data/cassandra/impl/Result.hpp"
#include "data/cassandra/impl/Session.hpp"
#include "data/cassandra/impl/Statement.hpp"

#include <cassandra.h>

#include <string_view>
#include <utility>

namespace data::cassandra {

/**
 * @brief Represents a handle to the cassandra database cluster
 */
class Handle {
    Cluster cluster_;
    Session session_;

public:
    using ResultOrErrorType = ResultOrError;
    using MaybeErrorType = MaybeError;
    using FutureType = Future;
    using StatementType = Statement;
    using PreparedStatementType = PreparedStatement;
    using ResultType = Result;

    /**
     * @brief Construct a new handle from a @ref impl::Settings object.
     *
     * @param clusterSettings The settings to use
     */
    explicit Handle(Settings clusterSettings = Settings::defaultSettings());

    /**
     * @brief Construct a new handle with default settings and only by setting the contact points.
     *
     * @param contactPoints The contact points to use instead of settings
     */
    explicit Handle(std::string_view contactPoints);

    /**
     * @brief Disconnects gracefully if possible.
     */
    ~Handle();

    Handle(Handle&&) = delete;
    Handle(Handle const&) = delete;

    /**
     * @brief Connect to the cluster asynchronously.
     *
     * @return A future
     */
    [[nodiscard]] FutureType
    asyncConnect() const;

    /**
     * @brief Synchonous version of the above.
     *
     * See @ref asyncConnect() const for how this works.
     *
     * @return Possibly an error
     */
    [[nodiscard]] MaybeErrorType
    connect() const;

    /**
     * @brief Connect to the the specified keyspace asynchronously.
     *
     * @param keyspace The keyspace to use
     * @return A future
     */
    [[nodiscard]] FutureType
    asyncConnect(std::string_view keyspace) const;

    /**
     * @brief Synchonous version of the above.
     *
     * See @ref asyncConnect(std::string_view) const for how this works.
     *
     * @param keyspace The keyspace to use
     * @return Possibly an error
     */
    [[nodiscard]] MaybeErrorType
    connect(std::string_view keyspace) const;

    /**
     * @brief Disconnect from the cluster asynchronously.
     *
     * @return A future
     */
    [[nodiscard]] FutureType
    asyncDisconnect() const;

    /**
     * @brief Synchonous version of the above.
     *
     * See @ref asyncDisconnect() const for how this works.
     *
     * @return Possibly an error
     */
    [[maybe_unused]] MaybeErrorType
    disconnect() const;

    /**
     * @brief Close the session and connect again to the specified keyspace.
     *
     * @param keyspace The keyspace to use
     * @return Possibly an error
     */
    [[nodiscard]] MaybeErrorType
    reconnect(std::string_view keyspace) const;

    /**
     * @brief Execute a simple query with optional args asynchronously.
     *
     * @param query The query to execute
     * @param args The arguments to bind for execution
     * @return A future
     */
    template <typename... Args>
    [[nodiscard]] FutureType
    asyncExecute(std::string_view query, Args&&... args) const
    {
        auto statement = StatementType{query, std::forward<Args>(args)...};
        return cass_session_execute(session_, statement);
    }

    /**
     * @brief Synchonous version of the above.
     *
     * See asyncExecute(std::string_view, Args&&...) const for how this works.
     *
     * @param query The query to execute
     * @param args The arguments to bind for execution
     * @return The result or an error
     */
    template <typename... Args>
    [[maybe_unused]] ResultOrErrorType
    execute(std::string_view query, Args&&... args) const
    {
        return asyncExecute<Args...>(query, std::forward<Args>(args)...).get();
    }

    /**
     * @brief Execute a single statement asynchronously.
     *
     * @param statement The statement to execute
     * @return A future
     */
    [[nodiscard]] FutureType
    asyncExecute(StatementType const& statement) const;

    /**
     * @brief Synchonous version of the above.
     *
     * See @ref asyncExecute(StatementType const&) const for how this works.
     *
     * @param statement The statement to execute
     * @return The result or an error
     */
    [[maybe_unused]] ResultOrErrorType
    execute(StatementType const& statement) const;

    /**
     * @brief Prepare a statement.
     *
     * @throws std::runtime_error with underlying error description on failure
     *
     * @param query The query to prepare
     * @return A prepared statement
     */
    [[nodiscard]] PreparedStatementType
    prepare(std::string_view query) const;
};

/**
 * @brief Extracts the results into series of std::tuple<Types...> by creating a simple wrapper with an STL input
 * iterator inside.
 *
 * You can call .begin() and .end() in order to iterate as usual.
 * This also means that you can use it in a range-based for or with some algorithms.
 *
 * @param result The result to iterate
 * @return An extractor object that can be iterated
 */
template <typename... Types>
[[nodiscard]] impl::ResultExtractor<Types...>
extract(Handle::ResultType const& result)
{
    return {result};
}

}  // namespace data::cassandra
