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

#include "util/Assert.hpp"
#include "util/config/ObjectView.hpp"
#include "util/config/ValueView.hpp"

#include <cstddef>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>

namespace util::config {

class ConfigDefinition;

/**
 * @brief View for array structure for config.
 *
 * This class provides a view into an array structure within ConfigDefinition.
 * It allows accessing individual elements of the array as either values or objects, and
 * is used within the ConfigDefinition to represent multiple potential values.
 */
class ArrayView {
public:
    /**
     * @brief Custom iterator class which contains config object or value underneath ArrayView
     *
     * @tparam T Either ObjectView or ValueView
     */
    template <typename T>
    struct ArrayIterator {
        static_assert(std::is_same_v<T, ObjectView> || std::is_same_v<T, ValueView>, "Unsupported iterator type");

        using iterator_category = std::forward_iterator_tag;
        using pointer = T const*;
        using reference = T const&;
        using value_type = T;
        using difference_type = std::ptrdiff_t;

        /**
         * @brief Constructs an ArrayIterator with underlying ArrayView and index value
         *
         * @param arr ArrayView to iterate
         * @param index Current index of the ArrayView
         */
        ArrayIterator(ArrayView const& arr, std::size_t index) : arr_{arr}, index_{index}
        {
        }

        /**
         * @brief Prefix increment operator
         *
         * @return Reference to the incremented ArrayIterator
         */
        ArrayIterator&
        operator++()
        {
            ++index_;
            return *this;
        }

        /**
         * @brief Postfix increment operator
         *
         * @return A copy of the ArrayIterator before increment
         */
        ArrayIterator
        operator++(int)
        {
            auto temp = *this;
            ++index_;
            return temp;
        }

        /**
         * @brief Dereference operator to get a ValueView or ObjectView
         *
         * @return ValueView of the ConfigValue or ObjectView of the object at the current index
         */
        T
        operator*() const
        {
            if constexpr (std::is_same_v<T, ObjectView>) {
                return arr_.get().objectAt(index_);
            } else {
                return arr_.get().valueAt(index_);
            }
        }

        /**
         * @brief Equality operator
         *
         * @param other Another ArrayIterator to compare
         * @return true if iterators are pointing to the same element, otherwise false
         */
        bool
        operator==(ArrayIterator const& other) const
        {
            return &arr_.get() == &other.arr_.get() && index_ == other.index_;
        }

    private:
        std::reference_wrapper<ArrayView const> arr_;
        std::size_t index_ = 0;
    };

    /**
     * @brief Constructs an ArrayView with the provided prefix and ConfigDefinition
     *
     * @param prefix Key of the array, without the trailing `.[]`
     * @param configDef ConfigDefinition this ArrayView is created from
     */
    ArrayView(std::string_view prefix, ConfigDefinition const& configDef);

    /**
     * @brief Returns an iterator to the beginning of the Array
     *
     * @tparam T The type of the iterator (ObjectView or ValueView)
     * @return Iterator to the beginning of the Array
     */
    template <typename T>
    [[nodiscard]] ArrayIterator<T>
    begin() const
    {
        return ArrayIterator<T>(*this, 0);
    }

    /**
     * @brief Returns an iterator to the end of the Array
     *
     * @tparam T The type of the iterator (ObjectView or ValueView)
     * @return Iterator to the end of the Array
     */
    template <typename T>
    [[nodiscard]] ArrayIterator<T>
    end() const
    {
        return ArrayIterator<T>(*this, size());
    }

    /**
     * @brief Returns an ObjectView at the specified index
     *
     * @param idx Index of the object to retrieve
     * @return ObjectView at the specified index
     */
    [[nodiscard]] ObjectView
    objectAt(std::size_t idx) const;

    /**
     * @brief Returns a ValueView at the specified index
     *
     * @param idx Index of the value to retrieve
     * @return ValueView at the specified index
     */
    [[nodiscard]] ValueView
    valueAt(std::size_t idx) const;

    /**
     * @brief Returns the number of elements in the array
     *
     * @return Number of elements in the array
     */
    [[nodiscard]] std::size_t
    size() const;

private:
    std::string prefix_;
    std::reference_wrapper<ConfigDefinition const> configDef_;
};

}  // namespace util::config
