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
#include <nybble/nibble/nibble.hpp>
#include <nybble/nibble/pair.hpp>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <ranges>
#include <type_traits>

NYBBLE_NAMESPACE_BEGIN

/// Which nibble of each byte is produced first
enum class NibbleOrder : uint8_t
{
    HighFirst,
    LowFirst,
};

/// Lazily produces the nibbles of a byte buffer, two per byte, in buffer
/// order and within each byte according to `NibbleOrder`. The buffer is only
/// read; it must outlive the sequence and its iterators. Copies of a
/// sequence advance independently.
class NibbleSequence
{
    byte_string_view source_{};
    NibbleOrder order_{NibbleOrder::HighFirst};
    size_t position_{0};

    static constexpr Nibble nibble_at(
        byte_string_view const source, NibbleOrder const order,
        size_t const position) noexcept
    {
        NYBBLE_DEBUG_ASSERT(position < 2 * source.size());
        auto const pair = split(source[position / 2]);
        bool const first = position % 2 == 0;
        return (first == (order == NibbleOrder::HighFirst)) ? pair.high
                                                            : pair.low;
    }

public:
    class iterator;

    constexpr NibbleSequence() = default;

    constexpr explicit NibbleSequence(
        byte_string_view const source,
        NibbleOrder const order = NibbleOrder::HighFirst) noexcept
        : source_{source}
        , order_{order}
    {
    }

    /// The next nibble, or nullopt once every byte has been consumed
    constexpr std::optional<Nibble> next() noexcept
    {
        if (NYBBLE_UNLIKELY(exhausted())) {
            return std::nullopt;
        }
        return nibble_at(source_, order_, position_++);
    }

    constexpr bool exhausted() const noexcept
    {
        return position_ == size();
    }

    /// total number of nibbles, twice the number of source bytes
    constexpr size_t size() const noexcept
    {
        return 2 * source_.size();
    }

    constexpr size_t remaining() const noexcept
    {
        return size() - position_;
    }

    /// index of the byte the next nibble comes from
    constexpr size_t byte_index() const noexcept
    {
        return position_ / 2;
    }

    /// 0 if the next nibble is the first of its byte, 1 if the second
    constexpr unsigned sub_position() const noexcept
    {
        return static_cast<unsigned>(position_ % 2);
    }

    constexpr NibbleOrder order() const noexcept
    {
        return order_;
    }

    constexpr byte_string_view source() const noexcept
    {
        return source_;
    }

    /// Iteration starts at the current cursor and does not move it
    constexpr iterator begin() const noexcept;

    constexpr std::default_sentinel_t end() const noexcept
    {
        return std::default_sentinel;
    }
};

class NibbleSequence::iterator
{
    byte_string_view source_{};
    NibbleOrder order_{NibbleOrder::HighFirst};
    size_t position_{0};

public:
    using iterator_concept = std::forward_iterator_tag;
    using iterator_category = std::input_iterator_tag;
    using value_type = Nibble;
    using difference_type = std::ptrdiff_t;

    constexpr iterator() = default;

    constexpr iterator(
        byte_string_view const source, NibbleOrder const order,
        size_t const position) noexcept
        : source_{source}
        , order_{order}
        , position_{position}
    {
    }

    constexpr Nibble operator*() const noexcept
    {
        return NibbleSequence::nibble_at(source_, order_, position_);
    }

    constexpr iterator &operator++() noexcept
    {
        ++position_;
        return *this;
    }

    constexpr iterator operator++(int) noexcept
    {
        auto const ret = *this;
        ++position_;
        return ret;
    }

    constexpr size_t position() const noexcept
    {
        return position_;
    }

    friend constexpr bool
    operator==(iterator const &a, iterator const &b) noexcept
    {
        return a.source_.data() == b.source_.data() &&
               a.position_ == b.position_;
    }

    friend constexpr bool
    operator==(iterator const &it, std::default_sentinel_t) noexcept
    {
        return it.position_ == 2 * it.source_.size();
    }
};

constexpr NibbleSequence::iterator NibbleSequence::begin() const noexcept
{
    return iterator{source_, order_, position_};
}

static_assert(std::forward_iterator<NibbleSequence::iterator>);
static_assert(std::ranges::forward_range<NibbleSequence>);
static_assert(std::is_trivially_copyable_v<NibbleSequence>);

NYBBLE_NAMESPACE_END

namespace std::ranges
{
    template <>
    inline constexpr bool enable_borrowed_range<nybble::NibbleSequence> = true;
}
