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

#include <expected>

namespace data::cassandra {

namespace impl {
class Session;
class Cluster;
struct Future;
struct Result;
class Statement;
class PreparedStatement;
struct Settings;

template <typename...>
class ResultExtractor;
}  // namespace impl

using Settings = impl::Settings;
using Future = impl::Future;
using Cluster = impl::Cluster;
using Session = impl::Session;
using Statement = impl::Statement;
using PreparedStatement = impl::PreparedStatement;
using Result = impl::Result;

template <typename... Types>
using ResultExtractor = impl::ResultExtractor<Types...>;

using MaybeError = std::expected<void, CassandraError>;
using ResultOrError = std::expected<Result, CassandraError>;
using Error = CassandraError;

}  // namespace data::cassandra
