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
#include <slotstore/core/likely.h>
#include <slotstore/core/result.hpp>
#include <slotstore/execution/contract/abi_decode.hpp>
#include <slotstore/execution/contract/abi_encode.hpp>
#include <slotstore/execution/contract/big_endian.hpp>
#include <slotstore/execution/value_store/value_store_contract.hpp>
#include <slotstore/execution/value_store/value_store_error.hpp>

#include <evmc/evmc.h>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <cstdint>
#include <utility>

SLOTSTORE_ANONYMOUS_NAMESPACE_BEGIN

//
// Gas Costs
//

// Both methods touch the value slot once. The gas cost is calculated as:
//
// get = COLD_SLOAD_COST
// set = COLD_SLOAD_COST + SSTORE_SET_COST
//

constexpr uint64_t COLD_SLOAD_COST = 2100;
constexpr uint64_t SSTORE_SET_COST = 20000;
constexpr uint64_t GET_OP_COST = COLD_SLOAD_COST;
constexpr uint64_t SET_OP_COST = COLD_SLOAD_COST + SSTORE_SET_COST;
constexpr uint64_t FALLBACK_COST = 40'000;

static_assert(SET_OP_COST == 22100);

Result<void> function_not_payable(u256_be const &value)
{
    if (SLOTSTORE_UNLIKELY(!value.is_zero())) {
        return ValueStoreError::ValueNonZero;
    }

    return outcome::success();
}

SLOTSTORE_ANONYMOUS_NAMESPACE_END

SLOTSTORE_NAMESPACE_BEGIN

ValueStoreContract::ValueStoreContract(State &state, Address const &address)
    : store_{state, address}
{
}

std::pair<ValueStoreContract::PrecompileFunc, uint64_t>
ValueStoreContract::precompile_dispatch(byte_string_view &input)
{
    auto const selector = abi_decode_selector(input);
    if (SLOTSTORE_UNLIKELY(!selector)) {
        return {&ValueStoreContract::precompile_fallback, FALLBACK_COST};
    }

    switch (selector.value()) {
    case SET_SELECTOR:
        return {&ValueStoreContract::precompile_set, SET_OP_COST};
    case GET_SELECTOR:
        return {&ValueStoreContract::precompile_get, GET_OP_COST};
    default:
        return {&ValueStoreContract::precompile_fallback, FALLBACK_COST};
    }
}

Result<byte_string> ValueStoreContract::precompile_set(
    byte_string_view input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(u256_be::from_bytes(msg_value)));
    BOOST_OUTCOME_TRY(auto const value, abi_decode_fixed<u256_be>(input));

    if (SLOTSTORE_UNLIKELY(!input.empty())) {
        return ValueStoreError::InvalidInput;
    }

    store_.set(value.native());

    return byte_string{};
}

Result<byte_string> ValueStoreContract::precompile_get(
    byte_string_view input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(u256_be::from_bytes(msg_value)));

    if (SLOTSTORE_UNLIKELY(!input.empty())) {
        return ValueStoreError::InvalidInput;
    }

    auto const word = abi_encode_uint(u256_be{store_.get()});
    return byte_string{word.bytes, sizeof(word.bytes)};
}

Result<byte_string> ValueStoreContract::precompile_fallback(
    byte_string_view, evmc_address const &, evmc_bytes32 const &)
{
    return ValueStoreError::MethodNotSupported;
}

SLOTSTORE_NAMESPACE_END
