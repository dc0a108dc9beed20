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

#include <boost/outcome/config.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#if __has_include(<boost/outcome/experimental/status-code/status-code/status_error.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/status_error.hpp>
#else
    #include <boost/outcome/experimental/status-code/status_error.hpp>
#endif

#include <cstdint>
#include <initializer_list>
#include <optional>

NYBBLE_NAMESPACE_BEGIN

/// Raised only by validated integer construction of a nibble
enum class RangeError
{
    Success = 0,
    OutOfRange,
};

/// Raised by textual parsing of nibbles and hex strings
enum class ParseError
{
    Success = 0,
    InvalidDigit,
    Empty,
    TooLarge,
};

/// Raised by fixed-capacity nibble vectors
enum class CapacityError
{
    Success = 0,
    Full,
};

NYBBLE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<nybble::RangeError>
    : quick_status_code_from_enum_defaults<nybble::RangeError>
{
    static constexpr auto const domain_name = "Nibble Range Error";
    static constexpr auto const domain_uuid =
        "3f0b6a52-8d1e-4c37-a9f4-5e27c1d8b604";

    static std::initializer_list<mapping> const &value_mappings();
};

template <>
struct quick_status_code_from_enum<nybble::ParseError>
    : quick_status_code_from_enum_defaults<nybble::ParseError>
{
    static constexpr auto const domain_name = "Nibble Parse Error";
    static constexpr auto const domain_uuid =
        "b81c04e9-27d5-4f6a-8e13-c9a05d7f2e48";

    static std::initializer_list<mapping> const &value_mappings();
};

template <>
struct quick_status_code_from_enum<nybble::CapacityError>
    : quick_status_code_from_enum_defaults<nybble::CapacityError>
{
    static constexpr auto const domain_name = "Nibble Capacity Error";
    static constexpr auto const domain_uuid =
        "6ad2f175-0c94-4b8e-b3e1-47f9a2c05d81";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END

NYBBLE_NAMESPACE_BEGIN

class range_error_code_domain_;
using range_error_code = BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<
    range_error_code_domain_>;

/// `RangeError::OutOfRange` carrying the rejected integer, saturated to the
/// range of int64_t. Codes of this domain compare equal to
/// `RangeError::OutOfRange` and to `errc::result_out_of_range`.
class range_error_code_domain_
    : public BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code_domain
{
    friend range_error_code;
    using base_ = BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code_domain;
    using range_enum_code = BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::
        quick_status_code_from_enum_code<RangeError>;

public:
    struct value_type
    {
        int64_t rejected{0};
    };

    using base_::string_ref;

    constexpr explicit range_error_code_domain_(
        typename base_::unique_id_type id = 0x9c41d7e2035fb8a6) noexcept
        : base_(id)
    {
    }

    range_error_code_domain_(range_error_code_domain_ const &) = default;
    range_error_code_domain_(range_error_code_domain_ &&) = default;
    range_error_code_domain_ &
    operator=(range_error_code_domain_ const &) = default;
    range_error_code_domain_ &operator=(range_error_code_domain_ &&) = default;
    ~range_error_code_domain_() = default;

    static inline constexpr range_error_code_domain_ const &get();

    virtual string_ref name() const noexcept override
    {
        return string_ref("Nibble Range Error");
    }

#if BOOST_OUTCOME_VERSION_MAJOR > 2 ||                                         \
    (BOOST_OUTCOME_VERSION_MAJOR == 2 && BOOST_OUTCOME_VERSION_MINOR > 2) ||   \
    (BOOST_OUTCOME_VERSION_MAJOR == 2 && BOOST_OUTCOME_VERSION_MINOR == 2 &&   \
     BOOST_OUTCOME_VERSION_PATCH > 2)
    virtual base_::payload_info_t payload_info() const noexcept override
    {
        return {
            sizeof(value_type),
            sizeof(status_code_domain *) + sizeof(value_type),
            (alignof(value_type) > alignof(status_code_domain *))
                ? alignof(value_type)
                : alignof(status_code_domain *)};
    }
#endif

protected:
    virtual bool _do_failure(
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &code)
        const noexcept override
    {
        (void)code;
        return true;
    }

    virtual bool _do_equivalent(
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &code1,
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &code2)
        const noexcept override
    {
        auto const &c1 = static_cast<range_error_code const &>(code1);
        if (code2.domain() == *this) {
            auto const &c2 = static_cast<range_error_code const &>(code2);
            return c1.value().rejected == c2.value().rejected;
        }
        if (code2.domain() == range_enum_code::domain_type::get()) {
            auto const &c2 = static_cast<range_enum_code const &>(code2);
            return c2.value() == RangeError::OutOfRange;
        }
        return false;
    }

    virtual BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::generic_code _generic_code(
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &code)
        const noexcept override
    {
        (void)code;
        return BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::errc::result_out_of_range;
    }

    virtual string_ref _do_message(
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &code)
        const noexcept override
    {
        (void)code;
        return string_ref("value out of nibble range");
    }

    BOOST_OUTCOME_SYSTEM_ERROR2_NORETURN virtual void _do_throw_exception(
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &code)
        const override
    {
        auto const &c = static_cast<range_error_code const &>(code);
        throw BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_error<
            range_error_code_domain_>(c);
    }
};

constexpr range_error_code_domain_ range_error_code_domain;

inline constexpr range_error_code_domain_ const &
range_error_code_domain_::get()
{
    return range_error_code_domain;
}

inline range_error_code make_range_error(int64_t const rejected) noexcept
{
    return range_error_code{range_error_code_domain_::value_type{rejected}};
}

/// The integer a failed `Nibble::from_integer` rejected, or nullopt if
/// `code` is from another domain
template <class StatusCode>
std::optional<int64_t> rejected_value(StatusCode const &code) noexcept
{
    if (code.domain() != range_error_code_domain) {
        return std::nullopt;
    }
    return range_error_code{code}.value().rejected;
}

NYBBLE_NAMESPACE_END
