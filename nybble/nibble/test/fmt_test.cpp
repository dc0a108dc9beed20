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

#include <nybble/core/basic_formatter.hpp>
#include <nybble/nibble/fmt/nibble_fmt.hpp>
#include <nybble/nibble/fmt/nibbles_view_fmt.hpp>
#include <nybble/nibble/hex.hpp>
#include <nybble/nibble/nibble.hpp>
#include <nybble/nibble/nibble_vector.hpp>
#include <nybble/nibble/nibbles_view.hpp>
#include <nybble/nibble/pair.hpp>

#include <gtest/gtest.h>

#include <sstream>

using namespace nybble;
using namespace nybble::literals;

TEST(NibbleFmtTest, nibble)
{
    EXPECT_EQ(fmt::format("{}", Nibble::from_masked(0xb)), "b");
    EXPECT_EQ(fmt::format("{}", Nibble{}), "0");
}

TEST(NibbleFmtTest, pair)
{
    EXPECT_EQ(fmt::format("{}", split(0x4b)), "4b");
    EXPECT_EQ(fmt::format("{}", split(0x0f)), "0f");
}

TEST(NibbleFmtTest, nibbles_view)
{
    auto const bytes = 0x12ab_hex;
    NibblesView const view{bytes};
    EXPECT_EQ(fmt::format("{}", view), "0x12ab");
    EXPECT_EQ(fmt::format("{}", view.substr(1, 2)), "0x2a");
    EXPECT_EQ(fmt::format("{}", view.substr(4)), "0x");
}

TEST(NibbleFmtTest, nibble_vectors)
{
    auto const bytes = 0x12ab_hex;
    NibbleVector const heap_v{NibblesView{bytes}.substr(3)};
    EXPECT_EQ(fmt::format("{}", heap_v), "0xb");

    NibbleArrayVector<4> inline_v;
    EXPECT_EQ(fmt::format("{}", inline_v), "0x");
    inline_v.push(Nibble::from_masked(0xc));
    EXPECT_EQ(fmt::format("{}", inline_v), "0xc");
}

TEST(NibbleFmtTest, stream_and_fmt_agree_on_views)
{
    auto const bytes = 0x12ab_hex;
    NibblesView const view{bytes};
    for (auto const v : {view, view.substr(1, 2), view.substr(4)}) {
        std::ostringstream os;
        os << v;
        EXPECT_EQ(os.str(), fmt::format("{}", v));
    }
}

TEST(NibbleFmtTest, stream_matches_fmt)
{
    std::ostringstream os;
    os << Nibble::from_masked(0xe) << ' ' << split(0xc3);
    EXPECT_EQ(os.str(), "e c3");
}
