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
#include <nybble/core/result.hpp>
#include <nybble/nibble/nibble_sequence.hpp>

#include <string>
#include <string_view>
#include <utility>

NYBBLE_NAMESPACE_BEGIN

/// Decodes hex text, with or without a "0x" prefix. An odd number of digits
/// is read as if a leading zero were present. Fails with
/// `ParseError::InvalidDigit`.
Result<byte_string> from_hex(std::string_view s);

/// One lower case digit per nibble, in the given order
std::string
to_hex(byte_string_view bytes, NibbleOrder order = NibbleOrder::HighFirst);

namespace literals
{
    inline byte_string operator""_hex(char const *s)
    {
        auto res = from_hex(s);
        NYBBLE_ASSERT(!res.has_error(), "invalid hex literal");
        return std::move(res).assume_value();
    }
};

NYBBLE_NAMESPACE_END
