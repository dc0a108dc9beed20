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

#include <nybble/core/config.hpp>
#include <nybble/nibble/nibble.hpp>

#include <compare>
#include <cstdint>
#include <ostream>

NYBBLE_NAMESPACE_BEGIN

/// The two nibbles of one byte. Ordering is by high nibble, then low nibble,
/// which is the ordering of the combined bytes.
struct NibblePair
{
    Nibble high;
    Nibble low;

    constexpr auto operator<=>(NibblePair const &) const = default;
};

static_assert(sizeof(NibblePair) == 2);

constexpr Nibble high_nibble(uint8_t const byte) noexcept
{
    return Nibble::from_masked(byte >> 4);
}

constexpr Nibble low_nibble(uint8_t const byte) noexcept
{
    return Nibble::from_masked(byte);
}

constexpr NibblePair split(uint8_t const byte) noexcept
{
    return {high_nibble(byte), low_nibble(byte)};
}

constexpr uint8_t combine(Nibble const high, Nibble const low) noexcept
{
    return static_cast<uint8_t>((high.value() << 4) | low.value());
}

constexpr uint8_t combine(NibblePair const pair) noexcept
{
    return combine(pair.high, pair.low);
}

/**
 * nibble `n` of a packed buffer; nibble 2k is the high half of byte k
 */
constexpr Nibble get_nibble(unsigned char const *const d, unsigned const n)
{
    auto const pair = split(d[n / 2]);
    return (n % 2 == 0) ? pair.high : pair.low;
}

/**
 * overwrites nibble `n` of a packed buffer, leaving the other half of the
 * byte untouched
 */
constexpr void
set_nibble(unsigned char *const d, unsigned const n, Nibble const v)
{
    auto pair = split(d[n / 2]);
    if (n % 2 == 0) {
        pair.high = v;
    }
    else {
        pair.low = v;
    }
    d[n / 2] = combine(pair);
}

inline std::ostream &operator<<(std::ostream &s, NibblePair const &p)
{
    return s << p.high << p.low;
}

NYBBLE_NAMESPACE_END
