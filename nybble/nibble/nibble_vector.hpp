// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <nybble/core/assert.h>
#include <nybble/core/byte_string.hpp>
#include <nybble/core/config.hpp>
#include <nybble/core/likely.h>
#include <nybble/core/result.hpp>
#include <nybble/nibble/nibble.hpp>
#include <nybble/nibble/nibble_error.hpp>
#include <nybble/nibble/nibbles_view.hpp>
#include <nybble/nibble/pair.hpp>

#include <boost/container/static_vector.hpp>
#include <boost/outcome/try.hpp>

#include <compare>
#include <concepts>
#include <cstddef>
#include <optional>
#include <ostream>

NYBBLE_NAMESPACE_BEGIN

/// Growable string of nibbles packed two per byte, the first nibble of each
/// byte in its high half. When the size is odd the unused low half of the
/// last byte is kept zero.
///
/// `Storage` is a contiguous byte container with `push_back`, `pop_back`
/// and `max_size`: `byte_string` for the heap allocated `NibbleVector`,
/// a `static_vector` for the inline `NibbleArrayVector`.
template <class Storage>
class BasicNibbleVector
{
    Storage bytes_{};
    size_t size_{0};

    void grow()
    {
        if (size_ % 2 == 0) {
            bytes_.push_back(0);
        }
        ++size_;
    }

    void shrink()
    {
        --size_;
        if (size_ % 2 == 0) {
            bytes_.pop_back();
        }
        else {
            set_nibble(bytes_.data(), size_, Nibble{});
        }
    }

public:
    BasicNibbleVector() = default;

    explicit BasicNibbleVector(NibblesView const nibbles)
    {
        append(nibbles);
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return size_ == 0;
    }

    size_t size() const noexcept
    {
        return size_;
    }

    /// nibbles storable without reallocating
    size_t capacity() const noexcept
    {
        return 2 * bytes_.capacity();
    }

    size_t max_size() const noexcept
    {
        return 2 * bytes_.max_size();
    }

    bool full() const noexcept
    {
        return size_ == max_size();
    }

    void reserve(size_t const nibbles)
    {
        bytes_.reserve((nibbles + 1) / 2);
    }

    [[nodiscard]] Nibble get(size_t const i) const
    {
        NYBBLE_ASSERT(i < size_);
        return get_nibble(bytes_.data(), i);
    }

    void set(size_t const i, Nibble const n)
    {
        NYBBLE_ASSERT(i < size_);
        set_nibble(bytes_.data(), i, n);
    }

    /// Fails with `CapacityError::Full` when no room is left
    Result<void> try_push(Nibble const n)
    {
        if (NYBBLE_UNLIKELY(full())) {
            return CapacityError::Full;
        }
        grow();
        set_nibble(bytes_.data(), size_ - 1, n);
        return outcome::success();
    }

    void push(Nibble const n)
    {
        NYBBLE_ASSERT(!full(), "nibble vector is full");
        grow();
        set_nibble(bytes_.data(), size_ - 1, n);
    }

    /// Inserts before position `index`, shifting later nibbles up by one.
    /// Fails with `CapacityError::Full` when no room is left.
    Result<void> try_insert(size_t const index, Nibble const n)
    {
        NYBBLE_ASSERT(index <= size_);
        BOOST_OUTCOME_TRY(try_push(n));
        for (size_t i = size_ - 1; i > index; --i) {
            set(i, get(i - 1));
        }
        set(index, n);
        return outcome::success();
    }

    void insert(size_t const index, Nibble const n)
    {
        NYBBLE_ASSERT(index <= size_);
        push(n);
        for (size_t i = size_ - 1; i > index; --i) {
            set(i, get(i - 1));
        }
        set(index, n);
    }

    /// Removes and returns the nibble at `index`, shifting later nibbles
    /// down by one
    Nibble remove(size_t const index)
    {
        auto const ret = get(index);
        for (size_t i = index; i + 1 < size_; ++i) {
            set(i, get(i + 1));
        }
        shrink();
        return ret;
    }

    std::optional<Nibble> pop()
    {
        if (NYBBLE_UNLIKELY(empty())) {
            return std::nullopt;
        }
        auto const ret = get(size_ - 1);
        shrink();
        return ret;
    }

    /// `nibbles` must not view this vector's own storage
    void append(NibblesView const nibbles)
    {
        NYBBLE_ASSERT(
            nibbles.size() <= max_size() - size_, "nibble vector is full");
        reserve(size_ + nibbles.size());
        for (size_t i = 0; i < nibbles.size(); ++i) {
            push(nibbles.get(i));
        }
    }

    void clear() noexcept
    {
        bytes_.clear();
        size_ = 0;
    }

    /// packed bytes, the low half of the last byte zero when size is odd
    byte_string_view bytes() const noexcept
    {
        return {bytes_.data(), bytes_.size()};
    }

    NibblesView view() const noexcept
    {
        return {bytes_.data(), 0, size_};
    }

    operator NibblesView() const noexcept
    {
        return view();
    }

    friend bool
    operator==(BasicNibbleVector const &a, NibblesView const b) noexcept
    {
        return a.view() == b;
    }

    friend std::strong_ordering
    operator<=>(BasicNibbleVector const &a, NibblesView const b) noexcept
    {
        return a.view() <=> b;
    }

    friend std::ostream &
    operator<<(std::ostream &s, BasicNibbleVector const &v)
    {
        return s << v.view();
    }
};

using NibbleVector = BasicNibbleVector<byte_string>;

/// Holds up to `N` nibbles inline, `N` rounded up to even; never allocates
template <size_t N>
using NibbleArrayVector = BasicNibbleVector<
    boost::container::static_vector<unsigned char, (N + 1) / 2>>;

template <class T>
concept nibble_concat_arg =
    std::same_as<T, Nibble> || std::convertible_to<T, NibblesView>;

/// Joins nibbles and nibble ranges into one left aligned vector
template <nibble_concat_arg... Args>
NibbleVector concat(Args const &...args)
{
    NibbleVector ret;
    (
        [&ret]<class T>(T const &arg) {
            if constexpr (std::same_as<T, Nibble>) {
                ret.push(arg);
            }
            else {
                ret.append(NibblesView{arg});
            }
        }(args),
        ...);
    return ret;
}

NYBBLE_NAMESPACE_END
