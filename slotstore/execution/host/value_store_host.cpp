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
#include <slotstore/execution/core/address.hpp>
#include <slotstore/execution/host/value_store_host.hpp>
#include <slotstore/execution/state/state.hpp>
#include <slotstore/execution/value_store/value_store_contract.hpp>
#include <slotstore/execution/value_store/value_store_error.hpp>

#include <evmc/evmc.h>
#include <evmc/hex.hpp>

#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <cstdint>
#include <mutex>
#include <string>

SLOTSTORE_ANONYMOUS_NAMESPACE_BEGIN

std::string to_hex(evmc_address const &address)
{
    return evmc::hex(evmc::bytes_view{address.bytes, sizeof(address.bytes)});
}

SLOTSTORE_ANONYMOUS_NAMESPACE_END

SLOTSTORE_NAMESPACE_BEGIN

ValueStoreHost::ValueStoreHost(State &state, Address const &address)
    : state_{state}
    , address_{address}
    , contract_{state, address}
{
}

Result<CallOutput> ValueStoreHost::call(evmc_message const &msg)
{
    std::lock_guard const lock{mutex_};

    if (SLOTSTORE_UNLIKELY(Address{msg.recipient} != address_)) {
        LOG_DEBUG(
            "rejecting call to 0x{}: not the store at 0x{}",
            to_hex(msg.recipient),
            to_hex(address_));
        return ValueStoreError::UnknownRecipient;
    }

    byte_string_view input{msg.input_data, msg.input_size};
    auto const [method, cost] = ValueStoreContract::precompile_dispatch(input);
    if (SLOTSTORE_UNLIKELY(
            msg.gas < 0 || static_cast<uint64_t>(msg.gas) < cost)) {
        LOG_DEBUG(
            "rejecting call from 0x{}: gas {} below cost {}",
            to_hex(msg.sender),
            msg.gas,
            cost);
        return ValueStoreError::OutOfGas;
    }

    state_.checkpoint();
    auto result = (contract_.*method)(input, msg.sender, msg.value);
    if (SLOTSTORE_UNLIKELY(result.has_error())) {
        state_.revert();
        LOG_WARNING(
            "call from 0x{} reverted: {}",
            to_hex(msg.sender),
            result.error().message().c_str());
        return std::move(result).error();
    }
    state_.commit();

    return CallOutput{.output = std::move(result).value(), .gas_used = cost};
}

SLOTSTORE_NAMESPACE_END
