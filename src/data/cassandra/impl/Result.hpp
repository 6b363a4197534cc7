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

#include "data/cassandra/impl/ManagedObject.hpp"

#include <cassandra.h>

#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace data::cassandra::impl {

namespace detail {

template <typename>
constexpr bool kIS_OPTIONAL_COLUMN = false;

template <typename T>
constexpr bool kIS_OPTIONAL_COLUMN<std::optional<T>> = true;

template <typename>
constexpr bool kUNSUPPORTED_COLUMN = false;

inline void
throwErrorIfNeeded(CassError rc, std::string_view label)
{
    if (rc == CASS_OK)
        return;
    auto const tag = '[' + std::string{label} + ']';
    throw std::logic_error(tag + ": " + cass_error_desc(rc));
}

/**
 * @brief Reads a text-like column. Uuid and inet columns are rendered in their canonical string form.
 *
 * @param value The column value
 * @return The string representation
 */
[[nodiscard]] std::string
extractString(CassValue const* value);

}  // namespace detail

template <typename Type>
[[nodiscard]] Type
extractColumn(CassRow const* row, std::size_t idx)
{
    using DecayedType = std::decay_t<Type>;
    auto const* value = cass_row_get_column(row, idx);

    if constexpr (detail::kIS_OPTIONAL_COLUMN<DecayedType>) {
        if (value == nullptr or cass_value_is_null(value))
            return std::nullopt;
        return extractColumn<typename DecayedType::value_type>(row, idx);
    } else if constexpr (std::is_same_v<DecayedType, std::string>) {
        return detail::extractString(value);
    } else if constexpr (std::is_same_v<DecayedType, bool>) {
        cass_bool_t flag = cass_false;
        detail::throwErrorIfNeeded(cass_value_get_bool(value, &flag), "Extract bool");
        return flag == cass_true;
    } else if constexpr (std::is_same_v<DecayedType, int32_t>) {
        cass_int32_t out = 0;
        detail::throwErrorIfNeeded(cass_value_get_int32(value, &out), "Extract int32");
        return out;
    } else if constexpr (std::is_same_v<DecayedType, int64_t>) {
        cass_int64_t out = 0;
        detail::throwErrorIfNeeded(cass_value_get_int64(value, &out), "Extract int64");
        return out;
    } else if constexpr (std::is_same_v<DecayedType, std::chrono::system_clock::time_point>) {
        cass_int64_t millis = 0;
        detail::throwErrorIfNeeded(cass_value_get_int64(value, &millis), "Extract timestamp");
        return std::chrono::system_clock::time_point{
            std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds{millis})
        };
    } else {
        static_assert(detail::kUNSUPPORTED_COLUMN<DecayedType>, "Unsupported type for extraction");
    }
}

struct Result : public ManagedObject<CassResult const> {
    /* implicit */ Result(CassResult const* ptr);

    [[nodiscard]] std::size_t
    numRows() const;

    [[nodiscard]] bool
    hasRows() const;

    template <typename... RowTypes>
    std::optional<std::tuple<RowTypes...>>
    get() const
        requires(std::tuple_size<std::tuple<RowTypes...>>{} > 1)
    {
        // row managed internally by cassandra driver, hence no ManagedObject.
        auto const* row = cass_result_first_row(*this);
        if (row == nullptr)
            return std::nullopt;

        std::size_t idx = 0;
        auto advanceId = [&idx]() { return idx++; };

        return std::make_optional<std::tuple<RowTypes...>>({extractColumn<RowTypes>(row, advanceId())...});
    }

    template <typename RowType>
    std::optional<RowType>
    get() const
    {
        // row managed internally by cassandra driver, hence no ManagedObject.
        auto const* row = cass_result_first_row(*this);
        if (row == nullptr)
            return std::nullopt;
        return std::make_optional<RowType>(extractColumn<RowType>(row, 0));
    }
};

class ResultIterator : public ManagedObject<CassIterator> {
    bool hasMore_ = false;

public:
    /* implicit */ ResultIterator(CassIterator* ptr);

    [[nodiscard]] static ResultIterator
    fromResult(Result const& result);

    [[maybe_unused]] bool
    moveForward();

    [[nodiscard]] bool
    hasMore() const;

    template <typename... RowTypes>
    std::tuple<RowTypes...>
    extractCurrentRow() const
    {
        // note: row is invalidated on each iteration.
        // managed internally by cassandra driver, hence no ManagedObject.
        auto const* row = cass_iterator_get_row(*this);

        std::size_t idx = 0;
        auto advanceId = [&idx]() { return idx++; };

        return {extractColumn<RowTypes>(row, advanceId())...};
    }
};

template <typename... Types>
class ResultExtractor {
    std::reference_wrapper<Result const> ref_;

public:
    struct Sentinel {};

    struct Iterator {
        using iterator_category = std::input_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = std::tuple<Types...>;

        /* implicit */ Iterator(ResultIterator iterator) : iterator_{std::move(iterator)}
        {
        }

        Iterator(Iterator&&) = default;

        value_type
        operator*() const
        {
            return iterator_.extractCurrentRow<Types...>();
        }

        Iterator&
        operator++()
        {
            iterator_.moveForward();
            return *this;
        }

        bool
        operator==(Sentinel const&) const
        {
            return not iterator_.hasMore();
        }

    private:
        ResultIterator iterator_;
    };

    ResultExtractor(Result const& result) : ref_{result}
    {
    }

    Iterator
    begin() const
    {
        return ResultIterator::fromResult(ref_);
    }

    Sentinel
    end() const
    {
        return {};
    }
};

}  // namespace data::cassandra::impl
