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

#include <nybble/core/basic_formatter.hpp>
#include <nybble/nibble/nibble.hpp>
#include <nybble/nibble/pair.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

template <>
struct quill::copy_loggable<nybble::Nibble> : std::true_type
{
};

template <>
struct quill::copy_loggable<nybble::NibblePair> : std::true_type
{
};

template <>
struct fmt::formatter<nybble::Nibble> : public nybble::BasicFormatter
{
    template <typename FormatContext>
    auto format(nybble::Nibble const &value, FormatContext &ctx) const
    {
        fmt::format_to(ctx.out(), "{}", value.to_hex_digit());
        return ctx.out();
    }
};

template <>
struct fmt::formatter<nybble::NibblePair> : public nybble::BasicFormatter
{
    template <typename FormatContext>
    auto format(nybble::NibblePair const &value, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "{}{}",
            value.high.to_hex_digit(),
            value.low.to_hex_digit());
        return ctx.out();
    }
};
