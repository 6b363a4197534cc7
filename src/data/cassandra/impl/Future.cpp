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

#include "data/cassandra/impl/Future.hpp"

#include "data/cassandra/Error.hpp"
#include "data/cassandra/Types.hpp"
#include "data/cassandra/impl/ManagedObject.hpp"
#include "data/cassandra/impl/Result.hpp"

#include <cassandra.h>
#include <fmt/core.h>

#include <cstddef>
#include <expected>
#include <string>

namespace {

constexpr auto kFUTURE_DELETER = [](CassFuture* ptr) { cass_future_free(ptr); };

std::string
describeError(CassFuture* ptr, CassError rc)
{
    char const* message = nullptr;
    std::size_t len = 0;
    cass_future_error_message(ptr, &message, &len);
    return fmt::format("{}: {}", cass_error_desc(rc), std::string{message, len});
}

}  // namespace

namespace data::cassandra::impl {

/* implicit */ Future::Future(CassFuture* ptr) : ManagedObject{ptr, kFUTURE_DELETER}
{
}

MaybeError
Future::await() const
{
    // cass_future_error_code blocks until the future is ready
    if (auto const rc = cass_future_error_code(*this); rc != CASS_OK)
        return std::unexpected{CassandraError{describeError(*this, rc), rc}};
    return {};
}

ResultOrError
Future::get() const
{
    if (auto const rc = cass_future_error_code(*this); rc != CASS_OK)
        return std::unexpected{CassandraError{"future::get(): " + describeError(*this, rc), rc}};

    return Result{cass_future_get_result(*this)};
}

CassNode const*
Future::coordinator() const
{
    return cass_future_coordinator(*this);
}

}  // namespace data::cassandra::impl
