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

#include <slotstore/core/byte_string.hpp>
#include <slotstore/core/config.hpp>
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
#include <string>
#include <vector>

SLOTSTORE_NAMESPACE_BEGIN

enum class CallListError
{
    Success = 0,
    MissingValue,
    UnknownCall,
};

struct Call
{
    byte_string input;
    bool is_get;
};

/**
 * Encode a command line call list such as `set 42 get set 0xff get` into
 * call data for the store, in order.
 */
Result<std::vector<Call>> parse_call_list(std::vector<std::string> const &);

SLOTSTORE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<slotstore::CallListError>
    : quick_status_code_from_enum_defaults<slotstore::CallListError>
{
    static constexpr auto const domain_name = "Call List Error";
    static constexpr auto const domain_uuid =
        "5f2e8a17-b0c4-4d39-a6e1-7c3d9b40e825";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
