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

#include <nybble/core/byte_string.hpp>
#include <nybble/core/config.hpp>
#include <nybble/core/result.hpp>
#include <nybble/nibble/hex.hpp>
#include <nybble/nibble/nibble.hpp>
#include <nybble/nibble/nibble_sequence.hpp>
#include <nybble/nibble/pair.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <string>
#include <string_view>

NYBBLE_NAMESPACE_BEGIN

Result<byte_string> from_hex(std::string_view s)
{
    if (s.starts_with("0x")) {
        s.remove_prefix(2);
    }

    byte_string r((s.size() + 1) / 2, static_cast<unsigned char>(0));
    size_t in = 0;
    size_t out = 0;
    // handle odd nibbles
    if (s.size() % 2) {
        BOOST_OUTCOME_TRY(auto const low, Nibble::from_hex_digit(s[in++]));
        r[out++] = combine(Nibble{}, low);
    }
    for (; in < s.size(); in += 2) {
        BOOST_OUTCOME_TRY(auto const high, Nibble::from_hex_digit(s[in]));
        BOOST_OUTCOME_TRY(auto const low, Nibble::from_hex_digit(s[in + 1]));
        r[out++] = combine(high, low);
    }
    return r;
}

std::string to_hex(byte_string_view const bytes, NibbleOrder const order)
{
    NibbleSequence const seq{bytes, order};
    std::string s;
    s.reserve(seq.size());
    for (Nibble const n : seq) {
        s.push_back(n.to_hex_digit());
    }
    return s;
}

NYBBLE_NAMESPACE_END
