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

#include "data/cassandra/impl/Result.hpp"

#include "data/cassandra/impl/ManagedObject.hpp"

#include <cassandra.h>

#include <cstddef>
#include <string>

namespace {

constexpr auto kRESULT_DELETER = [](CassResult const* ptr) { cass_result_free(ptr); };
constexpr auto kRESULT_ITERATOR_DELETER = [](CassIterator* ptr) { cass_iterator_free(ptr); };

}  // namespace

namespace data::cassandra::impl {

namespace detail {

std::string
extractString(CassValue const* value)
{
    switch (cass_value_type(value)) {
        case CASS_VALUE_TYPE_UUID:
        case CASS_VALUE_TYPE_TIMEUUID: {
            CassUuid uuid;
            throwErrorIfNeeded(cass_value_get_uuid(value, &uuid), "Extract uuid");
            std::string out(CASS_UUID_STRING_LENGTH - 1, '\0');
            cass_uuid_string(uuid, out.data());
            return out;
        }
        case CASS_VALUE_TYPE_INET: {
            CassInet inet;
            throwErrorIfNeeded(cass_value_get_inet(value, &inet), "Extract inet");
            std::string out(CASS_INET_STRING_LENGTH, '\0');
            cass_inet_string(inet, out.data());
            out.resize(out.find('\0'));
            return out;
        }
        default: {
            char const* text = nullptr;
            std::size_t len = 0;
            throwErrorIfNeeded(cass_value_get_string(value, &text, &len), "Extract string");
            return std::string{text, len};
        }
    }
}

}  // namespace detail

/* implicit */ Result::Result(CassResult const* ptr) : ManagedObject{ptr, kRESULT_DELETER}
{
}

[[nodiscard]] std::size_t
Result::numRows() const
{
    return cass_result_row_count(*this);
}

[[nodiscard]] bool
Result::hasRows() const
{
    return numRows() > 0;
}

/* implicit */ ResultIterator::ResultIterator(CassIterator* ptr)
    : ManagedObject{ptr, kRESULT_ITERATOR_DELETER}, hasMore_{cass_iterator_next(ptr) != 0u}
{
}

[[nodiscard]] ResultIterator
ResultIterator::fromResult(Result const& result)
{
    return {cass_iterator_from_result(result)};
}

[[maybe_unused]] bool
ResultIterator::moveForward()
{
    hasMore_ = (cass_iterator_next(*this) != 0u);
    return hasMore_;
}

[[nodiscard]] bool
ResultIterator::hasMore() const
{
    return hasMore_;
}

}  // namespace data::cassandra::impl
