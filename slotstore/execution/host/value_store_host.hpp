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
#include <slotstore/execution/value_store/value_store_contract.hpp>

#include <evmc/evmc.h>

#include <cstdint>
#include <mutex>

SLOTSTORE_NAMESPACE_BEGIN

struct CallOutput
{
    byte_string output;
    uint64_t gas_used;
};

/**
 * Presents calls to a single value store as one sequential stream.
 *
 * Concurrent callers are serialised by one exclusive lock around the whole
 * call, and each call is applied to the state all-or-nothing: a call that
 * fails leaves no writes behind.
 */
class ValueStoreHost
{
    std::mutex mutex_;
    State &state_;
    Address const address_;
    ValueStoreContract contract_;

public:
    ValueStoreHost(State &, Address const &);

    Address const &address() const noexcept
    {
        return address_;
    }

    Result<CallOutput> call(evmc_message const &);
};

SLOTSTORE_NAMESPACE_END
