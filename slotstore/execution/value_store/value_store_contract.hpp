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
#include <slotstore/execution/core/address.hpp>
#include <slotstore/execution/state/state.hpp>
#include <slotstore/execution/value_store/value_store.hpp>

#include <evmc/evmc.h>

#include <cstdint>
#include <utility>

SLOTSTORE_NAMESPACE_BEGIN

static constexpr Address VALUE_STORE_CA = Address{0x1000};

static constexpr uint32_t SET_SELECTOR = 0x60fe47b1; // set(uint256)
static constexpr uint32_t GET_SELECTOR = 0x6d4ce63c; // get()

// ABI entry point of a ValueStore living in the account at the given address.
class ValueStoreContract
{
    ValueStore store_;

public:
    ValueStoreContract(State &, Address const &);

    ValueStore &store() noexcept
    {
        return store_;
    }

    using PrecompileFunc = Result<byte_string> (ValueStoreContract::*)(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);

    //
    // Precompile methods
    //

    // Strips the selector from `input` and returns the handler with its
    // static gas cost.
    static std::pair<PrecompileFunc, uint64_t>
    precompile_dispatch(byte_string_view &input);

    Result<byte_string> precompile_set(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);

    Result<byte_string> precompile_get(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);

    Result<byte_string> precompile_fallback(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
};

SLOTSTORE_NAMESPACE_END
