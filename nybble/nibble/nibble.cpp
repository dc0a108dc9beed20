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

#include <nybble/core/assert.h>
#include <nybble/core/config.hpp>
#include <nybble/core/likely.h>
#include <nybble/core/result.hpp>
#include <nybble/nibble/nibble.hpp>
#include <nybble/nibble/nibble_error.hpp>

#include <cstdint>
#include <string_view>

NYBBLE_ANONYMOUS_NAMESPACE_BEGIN

// value of an alphanumeric digit in base 36, or 0xff
constexpr unsigned digit_value(char const c)
{
    if (c >= '0' && c <= '9') {
        return static_cast<unsigned>(c - '0');
    }
    if (c >= 'a' && c <= 'z') {
        return static_cast<unsigned>(c - 'a' + 10);
    }
    if (c >= 'A' && c <= 'Z') {
        return static_cast<unsigned>(c - 'A' + 10);
    }
    return 0xff;
}

NYBBLE_ANONYMOUS_NAMESPACE_END

NYBBLE_NAMESPACE_BEGIN

Result<Nibble>
Nibble::from_string(std::string_view const s, unsigned const radix)
{
    NYBBLE_ASSERT(radix >= 2 && radix <= 36, "radix must be in [2, 36]");

    if (NYBBLE_UNLIKELY(s.empty())) {
        return ParseError::Empty;
    }

    unsigned value = 0;
    for (char const c : s) {
        unsigned const digit = digit_value(c);
        if (NYBBLE_UNLIKELY(digit >= radix)) {
            return ParseError::InvalidDigit;
        }
        value = value * radix + digit;
        if (NYBBLE_UNLIKELY(value > max_value)) {
            return ParseError::TooLarge;
        }
    }
    return from_masked(value);
}

NYBBLE_NAMESPACE_END
