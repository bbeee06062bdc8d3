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
#include <slotstore/core/bytes.hpp>
#include <slotstore/core/config.hpp>
#include <slotstore/execution/contract/big_endian.hpp>

#include <intx/intx.hpp>

#include <cstdint>

SLOTSTORE_NAMESPACE_BEGIN

inline bytes32_t abi_encode_uint(u256_be const &value)
{
    return value.to_bytes32();
}

// Call data: 4-byte big-endian selector followed by one word per argument.
template <typename... Words>
byte_string abi_encode_call(uint32_t const selector, Words const &...words)
{
    byte_string out(sizeof(uint32_t), 0);
    intx::be::unsafe::store(out.data(), selector);
    (out.append(words.bytes, sizeof(words.bytes)), ...);
    return out;
}

SLOTSTORE_NAMESPACE_END
