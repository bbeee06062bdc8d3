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

#include <slotstore/core/config.hpp>
#include <slotstore/core/int.hpp>
#include <slotstore/execution/contract/big_endian.hpp>
#include <slotstore/execution/core/address.hpp>
#include <slotstore/execution/state/state.hpp>
#include <slotstore/execution/value_store/value_store.hpp>

SLOTSTORE_NAMESPACE_BEGIN

ValueStore::ValueStore(State &state, Address const &address)
    : value_{state, address, VALUE_SLOT}
{
}

void ValueStore::set(uint256_t const &x)
{
    value_.store(u256_be{x});
}

uint256_t ValueStore::get() const
{
    // an empty slot reads as zero
    return value_.load().value_or(u256_be{}).native();
}

SLOTSTORE_NAMESPACE_END
