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

#include <slotstore/core/config.hpp>
#include <slotstore/core/int.hpp>
#include <slotstore/core/result.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>
#include <string_view>

SLOTSTORE_NAMESPACE_BEGIN

enum class ParseError
{
    Success = 0,
    Empty,
    InvalidDigit,
    DomainViolation,
};

/**
 * Parse a decimal or 0x-prefixed hexadecimal string into a 256-bit word.
 * Values above 2^256 - 1 are rejected rather than wrapped or clamped.
 */
Result<uint256_t> parse_uint256(std::string_view);

SLOTSTORE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<slotstore::ParseError>
    : quick_status_code_from_enum_defaults<slotstore::ParseError>
{
    static constexpr auto const domain_name = "Parse Error";
    static constexpr auto const domain_uuid =
        "3e1d5b2a-8f44-4c71-9a0e-6b2f7c95d1a4";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
