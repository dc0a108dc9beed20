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
#include <nybble/nibble/nibble.hpp>
#include <nybble/nibble/pair.hpp>

#include <algorithm>
#include <compare>
#include <cstddef>
#include <limits>
#include <ostream>
#include <type_traits>

NYBBLE_NAMESPACE_BEGIN

/// Non-owning window of `size` nibbles onto a packed byte buffer, starting
/// `first` nibbles in, where nibble 2k is the high half of byte k. Any
/// buffer length is representable.
class NibblesView
{
    unsigned char const *data_{nullptr};
    size_t first_{0};
    size_t size_{0};

public:
    static constexpr size_t npos = std::numeric_limits<size_t>::max();

    constexpr NibblesView() = default;

    constexpr NibblesView(
        unsigned char const *const data, size_t const first,
        size_t const size) noexcept
        : data_{data}
        , first_{first}
        , size_{size}
    {
    }

    // every nibble of a byte string, high nibble first
    constexpr NibblesView(byte_string_view const bytes) noexcept
        : data_{bytes.data()}
        , size_{2 * bytes.size()}
    {
    }

    constexpr NibblesView(byte_string const &bytes) noexcept
        : NibblesView{byte_string_view{bytes}}
    {
    }

    [[nodiscard]] constexpr bool empty() const noexcept
    {
        return size_ == 0;
    }

    constexpr size_t size() const noexcept
    {
        return size_;
    }

    [[nodiscard]] constexpr Nibble get(size_t const i) const
    {
        NYBBLE_ASSERT(i < size_);
        return get_nibble(data_, first_ + i);
    }

    /// Like `std::string_view::substr`, `count` is clamped to what remains
    constexpr NibblesView
    substr(size_t const pos, size_t const count = npos) const
    {
        NYBBLE_ASSERT(pos <= size_);
        return {data_, first_ + pos, std::min(count, size_ - pos)};
    }

    constexpr bool starts_with(NibblesView const prefix) const
    {
        return prefix.size_ <= size_ && substr(0, prefix.size_) == prefix;
    }

    constexpr bool operator==(NibblesView const &other) const
    {
        if (size_ != other.size_) {
            return false;
        }
        for (size_t i = 0; i < size_; ++i) {
            if (get(i) != other.get(i)) {
                return false;
            }
        }
        return true;
    }

    /// Nibble by nibble; a proper prefix orders first
    constexpr std::strong_ordering operator<=>(NibblesView const &other) const
    {
        size_t const common = std::min(size_, other.size_);
        for (size_t i = 0; i < common; ++i) {
            if (auto const c = get(i) <=> other.get(i); c != 0) {
                return c;
            }
        }
        return size_ <=> other.size_;
    }
};

static_assert(std::is_trivially_copyable_v<NibblesView>);

/// "0x" then one hex digit per nibble, so "0x" alone when empty
inline std::ostream &operator<<(std::ostream &s, NibblesView const v)
{
    s << "0x";
    for (size_t i = 0; i < v.size(); ++i) {
        s << v.get(i);
    }
    return s;
}

NYBBLE_NAMESPACE_END
