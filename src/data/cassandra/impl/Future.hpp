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

#include "data/cassandra/Types.hpp"
#include "data/cassandra/impl/ManagedObject.hpp"

#include <cassandra.h>

namespace data::cassandra::impl {

struct Future : public ManagedObject<CassFuture> {
    /* implicit */ Future(CassFuture* ptr);

    MaybeError
    await() const;

    ResultOrError
    get() const;

    /**
     * @brief The node that coordinated the request; waits for the request to finish.
     *
     * @return The node, valid as long as this future; nullptr if the request never reached a node
     */
    [[nodiscard]] CassNode const*
    coordinator() const;
};

}  // namespace data::cassandra::impl
