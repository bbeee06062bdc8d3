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

#include <cstddef>
#include <type_traits>

SLOTSTORE_NAMESPACE_BEGIN

template <typename T>
constexpr size_t num_storage_slots()
{
    constexpr size_t SLOT_SIZE = sizeof(bytes32_t);
    return (sizeof(T) + SLOT_SIZE - 1) / SLOT_SIZE;
}

// Overlays a trivially copyable T on the minimum number of consecutive
// storage slots needed to hold it. Unused tail bytes are zero.
template <typename T>
    requires std::is_trivially_copyable_v<T>
struct StorageAdapter
{
    static constexpr size_t N = num_storage_slots<T>();

    union
    {
        struct
        {
            bytes32_t raw[N];

            constexpr bytes32_t &operator[](size_t const i) noexcept
            {
                return raw[i];
            }

            constexpr bytes32_t const &operator[](size_t const i) const noexcept
            {
                return raw[i];
            }

        } slots;

        T typed;
    };

    StorageAdapter()
        : slots{}
    {
    }

    StorageAdapter(T const &t)
        : slots{}
    {
        typed = t;
    }
};

SLOTSTORE_NAMESPACE_END
