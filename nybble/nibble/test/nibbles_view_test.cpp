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
#include <nybble/nibble/nibble.hpp>
#include <nybble/nibble/nibble_sequence.hpp>
#include <nybble/nibble/nibbles_view.hpp>
#include <nybble/nibble/pair.hpp>

#include <gtest/gtest.h>

#include <sstream>

using namespace nybble;
using namespace nybble::literals;

TEST(NibblesViewTest, nibbles_view)
{
    auto const path =
        0x1234567812345678123456781234567812345678123456781234567812345678_hex;

    NibblesView const a{path.data(), 12, 0};
    EXPECT_TRUE(a.empty());
    EXPECT_EQ(a, NibblesView{});

    NibblesView const b{path.data(), 12, 4};
    NibblesView const c{path.data(), 20, 4};
    EXPECT_EQ(b, c);

    NibblesView const d{path.data(), 15, 3};
    auto const expected_bytes = 0x8120_hex;
    EXPECT_EQ(d, (NibblesView{expected_bytes.data(), 0, 3}));
    EXPECT_EQ(d.size(), 3);
    EXPECT_EQ(d.get(0), Nibble::from_masked(8));
    EXPECT_EQ(d.get(2), Nibble::from_masked(2));
}

TEST(NibblesViewTest, from_byte_string)
{
    auto const bytes = 0x4bf0_hex;
    NibblesView const view{bytes};
    ASSERT_EQ(view.size(), 4);
    EXPECT_EQ(view.get(0).value(), 4);
    EXPECT_EQ(view.get(1).value(), 11);
    EXPECT_EQ(view.get(2).value(), 15);
    EXPECT_EQ(view.get(3).value(), 0);
}

TEST(NibblesViewTest, long_buffers_keep_every_nibble)
{
    for (size_t const length : {127u, 128u, 200u, 4096u}) {
        byte_string const bytes(length, 0xab);
        NibblesView const view{bytes};
        NibbleSequence const seq{bytes};

        ASSERT_EQ(view.size(), 2 * length);
        EXPECT_EQ(view.size(), seq.size());
        EXPECT_FALSE(view.empty());
        EXPECT_EQ(view.get(view.size() - 2).value(), 0xa);
        EXPECT_EQ(view.get(view.size() - 1).value(), 0xb);

        auto const tail = view.substr(255);
        EXPECT_EQ(tail.size(), 2 * length - 255);
        EXPECT_EQ(tail.get(0).value(), 0xb);
        EXPECT_TRUE(view.starts_with(view.substr(0, 300)));
    }
}

TEST(NibblesViewTest, substr_and_starts_with)
{
    auto const bytes = 0x123456_hex;
    NibblesView const view{bytes};

    auto const tail = view.substr(1);
    EXPECT_EQ(tail.size(), 5);
    EXPECT_EQ(tail.get(0).value(), 2);

    auto const middle = view.substr(2, 2);
    auto const expected = 0x34_hex;
    EXPECT_EQ(middle, NibblesView{expected});

    // count past the end is clamped
    EXPECT_EQ(view.substr(4, 100).size(), 2);
    EXPECT_TRUE(view.substr(6).empty());

    EXPECT_TRUE(view.starts_with(view.substr(0, 3)));
    EXPECT_FALSE(view.starts_with(tail));
    EXPECT_FALSE(view.substr(0, 2).starts_with(view));
    EXPECT_TRUE(view.starts_with(NibblesView{}));
}

TEST(NibblesViewTest, ordering)
{
    auto const a = 0x12_hex;
    auto const b = 0x13_hex;
    auto const c = 0x1234_hex;

    EXPECT_LT(NibblesView{a}, NibblesView{b});
    EXPECT_LT(NibblesView{a}, NibblesView{c});
    EXPECT_GT(NibblesView{b}, NibblesView{c});
    EXPECT_LT(NibblesView{}, NibblesView{a});
}

TEST(NibblesViewTest, stream)
{
    auto const bytes = 0xab0f_hex;
    std::ostringstream os;
    os << NibblesView{bytes}.substr(1);
    EXPECT_EQ(os.str(), "0xb0f");

    std::ostringstream empty;
    empty << NibblesView{bytes}.substr(4);
    EXPECT_EQ(empty.str(), "0x");
}
