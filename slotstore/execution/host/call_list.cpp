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

#include <slotstore/core/byte_string.hpp>
#include <slotstore/core/config.hpp>
#include <slotstore/core/parse_uint256.hpp>
#include <slotstore/core/result.hpp>
#include <slotstore/execution/contract/abi_encode.hpp>
#include <slotstore/execution/contract/big_endian.hpp>
#include <slotstore/execution/host/call_list.hpp>
#include <slotstore/execution/value_store/value_store_contract.hpp>

#include <boost/outcome/config.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

SLOTSTORE_NAMESPACE_BEGIN

Result<std::vector<Call>>
parse_call_list(std::vector<std::string> const &args)
{
    std::vector<Call> calls;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "get") {
            calls.push_back(
                Call{.input = abi_encode_call(GET_SELECTOR), .is_get = true});
        }
        else if (args[i] == "set") {
            if (i + 1 == args.size()) {
                LOG_ERROR("`set` at position {} has no value", i);
                return CallListError::MissingValue;
            }
            auto value = parse_uint256(args[i + 1]);
            if (value.has_error()) {
                LOG_ERROR(
                    "bad value `{}` for `set` at position {}: {}",
                    args[i + 1],
                    i,
                    value.error().message().c_str());
                return std::move(value).error();
            }
            calls.push_back(Call{
                .input = abi_encode_call(SET_SELECTOR, u256_be{value.value()}),
                .is_get = false});
            ++i;
        }
        else {
            LOG_ERROR("unknown call `{}` at position {}", args[i], i);
            return CallListError::UnknownCall;
        }
    }
    return calls;
}

SLOTSTORE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<slotstore::CallListError>::mapping> const &
quick_status_code_from_enum<slotstore::CallListError>::value_mappings()
{
    using slotstore::CallListError;

    static std::initializer_list<mapping> const v = {
        {CallListError::Success, "success", {errc::success}},
        {CallListError::MissingValue,
         "set is missing its value",
         {errc::invalid_argument}},
        {CallListError::UnknownCall, "unknown call", {errc::invalid_argument}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
