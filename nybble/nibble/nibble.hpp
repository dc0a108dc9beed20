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
#include <nybble/core/config.hpp>
#include <nybble/core/likely.h>
#include <nybble/core/result.hpp>
#include <nybble/nibble/nibble_error.hpp>

#include <array>
#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <utility>

NYBBLE_NAMESPACE_BEGIN

/// Integer types a nibble can be built from or converted to. Character and
/// boolean types are excluded; hex digits go through `from_hex_digit`.
template <typename T>
concept nibble_integer =
    std::integral<T> && !std::same_as<T, bool> && !std::same_as<T, char> &&
    !std::same_as<T, wchar_t> && !std::same_as<T, char8_t> &&
    !std::same_as<T, char16_t> && !std::same_as<T, char32_t>;

/**
 * value of a hex digit, or 0xff if `h` is not one
 */
inline constexpr unsigned char hex_digit_value(char const h)
{
    if (h >= '0' && h <= '9') {
        return static_cast<unsigned char>(h - '0');
    }
    else if (h >= 'a' && h <= 'f') {
        return static_cast<unsigned char>(h - 'a' + 10);
    }
    else if (h >= 'A' && h <= 'F') {
        return static_cast<unsigned char>(h - 'A' + 10);
    }
    else {
        return 0xff;
    }
}

/// Short textual rendering of a nibble, stored inline. At most four
/// characters are ever needed (binary "1111").
class NibbleString
{
    std::array<char, 4> chars_{};
    uint8_t size_{0};

public:
    constexpr NibbleString() = default;

    constexpr void push_back(char const c) noexcept
    {
        NYBBLE_DEBUG_ASSERT(size_ < chars_.size());
        chars_[size_++] = c;
    }

    constexpr size_t size() const noexcept
    {
        return size_;
    }

    constexpr std::string_view view() const noexcept
    {
        return {chars_.data(), size_};
    }

    friend constexpr bool
    operator==(NibbleString const &lhs, std::string_view const rhs) noexcept
    {
        return lhs.view() == rhs;
    }
};

/// A 4-bit unsigned integer. Always holds a value in [0, 15].
///
/// Arithmetic is only offered as explicitly named wrapping operations that
/// reduce modulo 16. The bitwise operators are closed over [0, 15] and are
/// provided as ordinary operators.
class Nibble
{
    uint8_t value_{0};

    constexpr Nibble(uint8_t const value, std::in_place_t) noexcept
        : value_{value}
    {
    }

public:
    static constexpr uint8_t max_value = 0xF;

    constexpr Nibble() = default;

    /// Fails unless 0 <= v <= 15 with a `range_error_code` that compares
    /// equal to `RangeError::OutOfRange`; `rejected_value` recovers `v`,
    /// saturated to int64_t
    template <nibble_integer T>
    static Result<Nibble> from_integer(T const v)
    {
        if (NYBBLE_UNLIKELY(
                std::cmp_less(v, 0) || std::cmp_greater(v, max_value))) {
            return make_range_error(
                std::in_range<int64_t>(v)
                    ? static_cast<int64_t>(v)
                    : std::numeric_limits<int64_t>::max());
        }
        return Nibble{static_cast<uint8_t>(v), std::in_place};
    }

    /// Keeps the low 4 bits of `v`, i.e. `v mod 16`; never fails
    template <nibble_integer T>
    static constexpr Nibble from_masked(T const v) noexcept
    {
        auto const bits = static_cast<std::make_unsigned_t<T>>(v);
        return Nibble{static_cast<uint8_t>(bits & max_value), std::in_place};
    }

    /// Case insensitive; fails with `ParseError::InvalidDigit`
    static Result<Nibble> from_hex_digit(char const c)
    {
        auto const v = hex_digit_value(c);
        if (NYBBLE_UNLIKELY(v == 0xff)) {
            return ParseError::InvalidDigit;
        }
        return Nibble{v, std::in_place};
    }

    /// Parses `s` as a number in `radix` (2 to 36). Fails with
    /// `ParseError::Empty`, `ParseError::InvalidDigit` or
    /// `ParseError::TooLarge`.
    static Result<Nibble> from_string(std::string_view s, unsigned radix = 10);

    constexpr uint8_t value() const noexcept
    {
        return value_;
    }

    template <nibble_integer T = uint8_t>
    constexpr T to_integer() const noexcept
    {
        return static_cast<T>(value_);
    }

    constexpr char to_hex_digit() const noexcept
    {
        return static_cast<char>(
            value_ < 10 ? '0' + value_ : 'a' + (value_ - 10));
    }

    constexpr char to_upper_hex_digit() const noexcept
    {
        return static_cast<char>(
            value_ < 10 ? '0' + value_ : 'A' + (value_ - 10));
    }

    /// Binary digits, most significant first; without `pad` leading zeros
    /// are dropped ("0" for zero), with `pad` all four bits are shown
    constexpr NibbleString to_binary_string(bool const pad = false) const
    {
        NibbleString s;
        for (int bit = 3; bit >= 0; --bit) {
            bool const set = (value_ >> bit) & 1;
            if (set || pad || s.size() || bit == 0) {
                s.push_back(set ? '1' : '0');
            }
        }
        return s;
    }

    constexpr NibbleString to_octal_string() const
    {
        NibbleString s;
        if (value_ >= 8) {
            s.push_back(static_cast<char>('0' + value_ / 8));
        }
        s.push_back(static_cast<char>('0' + value_ % 8));
        return s;
    }

    constexpr NibbleString to_decimal_string() const
    {
        NibbleString s;
        if (value_ >= 10) {
            s.push_back('1');
        }
        s.push_back(static_cast<char>('0' + value_ % 10));
        return s;
    }

    [[nodiscard]] constexpr Nibble
    wrapping_add(Nibble const other) const noexcept
    {
        return from_masked(value_ + other.value_);
    }

    [[nodiscard]] constexpr Nibble
    wrapping_sub(Nibble const other) const noexcept
    {
        return from_masked(value_ - other.value_);
    }

    [[nodiscard]] constexpr Nibble
    wrapping_mul(Nibble const other) const noexcept
    {
        return from_masked(value_ * other.value_);
    }

    /// Bits shifted past bit 3 are discarded
    [[nodiscard]] constexpr Nibble wrapping_shl(unsigned const n) const noexcept
    {
        return n >= 4 ? Nibble{} : from_masked(value_ << n);
    }

    [[nodiscard]] constexpr Nibble wrapping_shr(unsigned const n) const noexcept
    {
        return n >= 4 ? Nibble{} : Nibble{uint8_t(value_ >> n), std::in_place};
    }

    friend constexpr Nibble operator&(Nibble const a, Nibble const b) noexcept
    {
        return Nibble{uint8_t(a.value_ & b.value_), std::in_place};
    }

    friend constexpr Nibble operator|(Nibble const a, Nibble const b) noexcept
    {
        return Nibble{uint8_t(a.value_ | b.value_), std::in_place};
    }

    friend constexpr Nibble operator^(Nibble const a, Nibble const b) noexcept
    {
        return Nibble{uint8_t(a.value_ ^ b.value_), std::in_place};
    }

    friend constexpr Nibble operator~(Nibble const a) noexcept
    {
        return Nibble{uint8_t(~a.value_ & max_value), std::in_place};
    }

    constexpr auto operator<=>(Nibble const &) const = default;
};

static_assert(sizeof(Nibble) == 1);
static_assert(std::is_trivially_copyable_v<Nibble>);

inline std::ostream &operator<<(std::ostream &s, Nibble const n)
{
    return s << n.to_hex_digit();
}

NYBBLE_NAMESPACE_END

template <>
struct std::hash<nybble::Nibble>
{
    size_t operator()(nybble::Nibble const n) const noexcept
    {
        return std::hash<uint8_t>{}(n.value());
    }
};
