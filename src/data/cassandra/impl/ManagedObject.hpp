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

#include <memory>
#include <stdexcept>

namespace data::cassandra::impl {

/**
 * @brief Owns a driver object and frees it with the supplied deleter.
 *
 * @tparam Managed The driver type
 */
template <typename Managed>
class ManagedObject {
protected:
    std::unique_ptr<Managed, void (*)(Managed*)> ptr_;

public:
    template <typename DeleterCallback>
    ManagedObject(Managed* rawPtr, DeleterCallback deleter) : ptr_{rawPtr, deleter}
    {
        if (rawPtr == nullptr)
            throw std::runtime_error("Could not create DB object - got nullptr");
    }

    ManagedObject(ManagedObject&&) = default;

    operator Managed*() const
    {
        return ptr_.get();
    }
};

}  // namespace data::cassandra::impl
