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

#include <nybble/nibble/nibble_error.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<nybble::RangeError>::mapping> const &
quick_status_code_from_enum<nybble::RangeError>::value_mappings()
{
    using nybble::RangeError;

    static std::initializer_list<mapping> const v = {
        {RangeError::Success, "success", {errc::success}},
        {RangeError::OutOfRange,
         "value out of nibble range",
         {errc::result_out_of_range}},
    };

    return v;
}

std::initializer_list<
    quick_status_code_from_enum<nybble::ParseError>::mapping> const &
quick_status_code_from_enum<nybble::ParseError>::value_mappings()
{
    using nybble::ParseError;

    static std::initializer_list<mapping> const v = {
        {ParseError::Success, "success", {errc::success}},
        {ParseError::InvalidDigit,
         "string was not a valid number",
         {errc::invalid_argument}},
        {ParseError::Empty, "string was empty", {errc::invalid_argument}},
        {ParseError::TooLarge,
         "number was too large",
         {errc::result_out_of_range}},
    };

    return v;
}

std::initializer_list<
    quick_status_code_from_enum<nybble::CapacityError>::mapping> const &
quick_status_code_from_enum<nybble::CapacityError>::value_mappings()
{
    using nybble::CapacityError;

    static std::initializer_list<mapping> const v = {
        {CapacityError::Success, "success", {errc::success}},
        {CapacityError::Full,
         "nibble vector is full",
         {errc::no_buffer_space}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
