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
#include <nybble/nibble/hex.hpp>
#include <nybble/nibble/nibble_error.hpp>
#include <nybble/nibble/nibble_sequence.hpp>

#include <gtest/gtest.h>

using namespace nybble;
using namespace nybble::literals;

TEST(HexTest, variable_length_hex)
{
    EXPECT_EQ((0x123456781234567812345678_hex).size(), 12);
    EXPECT_EQ(
        0x123456781234567812345678_hex,
        byte_string({
            0x12, 0x34, 0x56, 0x78, 0x12, 0x34,
            0x56, 0x78, 0x12, 0x34, 0x56, 0x78,
        }));

    // without 0x prefix
    EXPECT_EQ((12345678_hex).size(), 4);
    EXPECT_EQ(12345678_hex, byte_string({0x12, 0x34, 0x56, 0x78}));

    // odd number of nibbles
    EXPECT_EQ(
        0x12345678123_hex,
        byte_string({0x01, 0x23, 0x45, 0x67, 0x81, 0x23}));
}

TEST(HexTest, from_hex)
{
    auto const res = from_hex("0x4bF0");
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), byte_string({0x4b, 0xf0}));

    EXPECT_EQ(from_hex("").value(), byte_string{});
    EXPECT_EQ(from_hex("0x").value(), byte_string{});
    EXPECT_EQ(from_hex("f").value(), byte_string({0x0f}));
}

TEST(HexTest, from_hex_rejects_invalid_digits)
{
    for (auto const *const s :
         {"0xg0", "12 34", "4b-f0", "x12", "0X12", "abc!"}) {
        auto const res = from_hex(s);
        ASSERT_TRUE(res.has_error()) << s;
        EXPECT_EQ(res.assume_error(), ParseError::InvalidDigit) << s;
    }
}

TEST(HexTest, to_hex)
{
    auto const bytes = 0x4bf0_hex;
    EXPECT_EQ(to_hex(bytes), "4bf0");
    EXPECT_EQ(to_hex(bytes, NibbleOrder::LowFirst), "b40f");
    EXPECT_EQ(to_hex(byte_string_view{}), "");

    for (auto const *const s : {"00", "0123456789abcdef", "deadbeef", "ff"}) {
        EXPECT_EQ(to_hex(from_hex(s).value()), s);
    }
}
