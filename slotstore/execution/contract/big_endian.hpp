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

#include <evmc/evmc.h>

#include <intx/intx.hpp>

#include <algorithm>
#include <bit>
#include <cstdint>
#include <cstring>
#include <iterator>

SLOTSTORE_NAMESPACE_BEGIN

// A 256-bit word in the big-endian byte order used by storage slots and ABI
// arguments.
struct u256_be
{
    uint8_t bytes[32];

    constexpr u256_be() noexcept
        : bytes{}
    {
    }

    u256_be(uint256_t const &x) noexcept
    {
        intx::be::unsafe::store(bytes, x);
    }

    static u256_be from_bytes(evmc_bytes32 const &raw) noexcept
    {
        u256_be r;
        std::memcpy(r.bytes, raw.bytes, sizeof(r.bytes));
        return r;
    }

    static u256_be from_bytes(uint8_t const *const data) noexcept
    {
        u256_be r;
        std::memcpy(r.bytes, data, sizeof(r.bytes));
        return r;
    }

    uint256_t native() const noexcept
    {
        return intx::be::unsafe::load<uint256_t>(bytes);
    }

    bytes32_t to_bytes32() const noexcept
    {
        return std::bit_cast<bytes32_t>(*this);
    }

    bool is_zero() const noexcept
    {
        return std::all_of(
            std::begin(bytes), std::end(bytes), [](uint8_t const b) {
                return b == 0;
            });
    }

    bool operator==(u256_be const &) const = default;
};

static_assert(sizeof(u256_be) == 32);
static_assert(alignof(u256_be) == 1);

SLOTSTORE_NAMESPACE_END
