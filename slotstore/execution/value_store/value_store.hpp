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

#include <slotstore/core/bytes.hpp>
#include <slotstore/core/config.hpp>
#include <slotstore/core/int.hpp>
#include <slotstore/execution/contract/big_endian.hpp>
#include <slotstore/execution/contract/storage_variable.hpp>
#include <slotstore/execution/core/address.hpp>
#include <slotstore/execution/state/state.hpp>

SLOTSTORE_NAMESPACE_BEGIN

// Slot holding the stored value in the account of the store.
inline constexpr bytes32_t VALUE_SLOT{};

// clang-format off
// Morally, this class is equivalent to the following Solidity contract:
//
// contract SimpleStorage {
//   uint256 storedData;
//
//   function set(uint256 x) public {
//     storedData = x;
//   }
//
//   function get() public view returns (uint256) {
//     return storedData;
//   }
// }
// clang-format on
//
// The store performs no locking; callers are serialised by the host.
class ValueStore
{
    StorageVariable<u256_be> value_;

public:
    ValueStore(State &, Address const &);

    void set(uint256_t const &);

    uint256_t get() const;
};

SLOTSTORE_NAMESPACE_END
