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
#include <slotstore/execution/contract/storage_adapter.hpp>
#include <slotstore/execution/core/address.hpp>
#include <slotstore/execution/state/state.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <optional>
#include <utility>

SLOTSTORE_NAMESPACE_BEGIN

// A typed variable occupying the slots `key`, `key + 1`, ... of an account.
template <typename T>
class StorageVariable
{
    State &state_;
    Address const address_;
    bytes32_t const key_;

    bytes32_t slot_key_(size_t const i) const noexcept
    {
        if (i == 0) {
            return key_;
        }
        return intx::be::store<bytes32_t>(
            intx::be::load<uint256_t>(key_) + i);
    }

    void store_(StorageAdapter<T> const &adapter)
    {
        for (size_t i = 0; i < N; ++i) {
            state_.set_storage(address_, slot_key_(i), adapter.slots[i]);
        }
    }

public:
    static constexpr size_t N = num_storage_slots<T>();

    StorageVariable(State &state, Address const &address, bytes32_t key)
        : state_{state}
        , address_{address}
        , key_{std::move(key)}
    {
    }

    std::optional<T> load() const noexcept
    {
        StorageAdapter<T> value;
        bool has_data = false;
        for (size_t i = 0; i < N; ++i) {
            value.slots[i] = state_.get_storage(address_, slot_key_(i));
            has_data |= (value.slots[i] != bytes32_t{});
        }
        return has_data ? value.typed : std::optional<T>{};
    }

    void store(T const &value)
    {
        StorageAdapter<T> adapter(value);
        store_(adapter);
    }

    void clear()
    {
        StorageAdapter<T> adapter{};
        store_(adapter);
    }
};

SLOTSTORE_NAMESPACE_END
