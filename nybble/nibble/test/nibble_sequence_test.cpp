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

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <ranges>
#include <thread>
#include <vector>

using namespace nybble;
using namespace nybble::literals;

namespace
{
    std::vector<int> drain(NibbleSequence seq)
    {
        std::vector<int> out;
        while (auto const n = seq.next()) {
            out.push_back(n->to_integer<int>());
        }
        return out;
    }
}

TEST(NibbleSequenceTest, high_first)
{
    auto const bytes = 0x4bf0_hex;
    EXPECT_EQ(drain(NibbleSequence{bytes}), (std::vector<int>{4, 11, 15, 0}));
    EXPECT_EQ(
        drain(NibbleSequence{bytes, NibbleOrder::HighFirst}),
        (std::vector<int>{4, 11, 15, 0}));
}

TEST(NibbleSequenceTest, low_first)
{
    auto const bytes = 0x4bf0_hex;
    EXPECT_EQ(
        drain(NibbleSequence{bytes, NibbleOrder::LowFirst}),
        (std::vector<int>{11, 4, 0, 15}));
}

TEST(NibbleSequenceTest, default_order_is_high_first)
{
    NibbleSequence const seq{0x12_hex};
    EXPECT_EQ(seq.order(), NibbleOrder::HighFirst);
    EXPECT_EQ(NibbleSequence{}.order(), NibbleOrder::HighFirst);
}

TEST(NibbleSequenceTest, exhaustion)
{
    auto const bytes = 0xabcdef_hex;
    NibbleSequence seq{bytes};
    EXPECT_EQ(seq.size(), 6);

    for (size_t i = 0; i < 6; ++i) {
        EXPECT_FALSE(seq.exhausted());
        EXPECT_EQ(seq.remaining(), 6 - i);
        EXPECT_EQ(seq.byte_index(), i / 2);
        EXPECT_EQ(seq.sub_position(), i % 2);
        ASSERT_TRUE(seq.next().has_value());
    }
    EXPECT_TRUE(seq.exhausted());
    EXPECT_EQ(seq.remaining(), 0);
    EXPECT_EQ(seq.next(), std::nullopt);
    EXPECT_EQ(seq.next(), std::nullopt);
}

TEST(NibbleSequenceTest, empty_source)
{
    byte_string const empty{};
    NibbleSequence seq{empty};
    EXPECT_EQ(seq.size(), 0);
    EXPECT_TRUE(seq.exhausted());
    EXPECT_EQ(seq.next(), std::nullopt);
    EXPECT_EQ(seq.begin(), seq.end());
}

TEST(NibbleSequenceTest, yields_twice_the_source_length)
{
    byte_string bytes;
    for (unsigned i = 0; i < 300; ++i) {
        bytes.push_back(static_cast<uint8_t>(i * 7));
        for (auto const order :
             {NibbleOrder::HighFirst, NibbleOrder::LowFirst}) {
            EXPECT_EQ(
                drain(NibbleSequence{bytes, order}).size(), 2 * bytes.size());
        }
    }
}

TEST(NibbleSequenceTest, restart_is_independent)
{
    auto const bytes = 0x0123456789abcdef_hex;
    NibbleSequence first{bytes};
    ASSERT_EQ(first.next()->value(), 0);
    ASSERT_EQ(first.next()->value(), 1);
    ASSERT_EQ(first.next()->value(), 2);

    NibbleSequence second{bytes};
    std::vector<int> expected;
    for (int v = 0; v < 16; ++v) {
        expected.push_back(v);
    }
    EXPECT_EQ(drain(second), expected);

    // copies carry their own cursor
    auto copy = first;
    EXPECT_EQ(copy.next()->value(), 3);
    EXPECT_EQ(first.next()->value(), 3);
    EXPECT_EQ(first.remaining(), copy.remaining());

    EXPECT_EQ(bytes, 0x0123456789abcdef_hex);
}

TEST(NibbleSequenceTest, range_iteration)
{
    auto const bytes = 0x4bf0_hex;
    NibbleSequence seq{bytes, NibbleOrder::LowFirst};

    std::vector<int> out;
    for (Nibble const n : seq) {
        out.push_back(n.to_integer<int>());
    }
    EXPECT_EQ(out, (std::vector<int>{11, 4, 0, 15}));

    // iteration leaves the cursor alone
    EXPECT_EQ(seq.remaining(), 4);

    ASSERT_TRUE(seq.next().has_value());
    EXPECT_EQ(std::ranges::distance(seq.begin(), seq.end()), 3);
    EXPECT_EQ(*seq.begin(), Nibble::from_masked(4));

    auto const it = std::ranges::find(seq, Nibble::from_masked(15));
    ASSERT_NE(it, seq.end());
    EXPECT_EQ(it.position(), 3);
}

TEST(NibbleSequenceTest, reassemble_bytes_by_position)
{
    auto const bytes = 0xdeadbeef_hex;
    for (auto const order : {NibbleOrder::HighFirst, NibbleOrder::LowFirst}) {
        NibbleSequence seq{bytes, order};
        byte_string rebuilt;
        while (auto const first = seq.next()) {
            auto const second = seq.next();
            ASSERT_TRUE(second.has_value());
            rebuilt.push_back(
                order == NibbleOrder::HighFirst ? combine(*first, *second)
                                                : combine(*second, *first));
        }
        EXPECT_EQ(rebuilt, bytes);
    }
}

TEST(NibbleSequenceTest, concurrent_readers)
{
    byte_string bytes;
    for (unsigned i = 0; i < 4096; ++i) {
        bytes.push_back(static_cast<uint8_t>(i));
    }
    auto const expected = drain(NibbleSequence{bytes});

    std::vector<std::vector<int>> results(4);
    std::vector<std::thread> threads;
    for (auto &result : results) {
        threads.emplace_back(
            [&bytes, &result] { result = drain(NibbleSequence{bytes}); });
    }
    for (auto &t : threads) {
        t.join();
    }
    for (auto const &result : results) {
        EXPECT_EQ(result, expected);
    }
}

#ifndef NDEBUG
TEST(NibbleSequenceDeathTest, dereference_past_end)
{
    auto const bytes = 0x4b_hex;
    NibbleSequence const seq{bytes};
    auto it = seq.begin();
    ++it;
    EXPECT_EQ(*it, Nibble::from_masked(0xb));
    ++it;
    ASSERT_TRUE(it == seq.end());
    EXPECT_DEATH((void)*it, "Assertion 'position < 2");
}
#endif
