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
#include <slotstore/core/likely.h>
#include <slotstore/core/result.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstdint>
#include <initializer_list>
#include <type_traits>

#include <intx/intx.hpp>

SLOTSTORE_NAMESPACE_BEGIN

enum class AbiDecodeError
{
    Success = 0,
    InputTooShort,
};

// Consumes one 32-byte word from the front of `enc`.
template <typename T>
    requires(std::is_trivially_copyable_v<T> && sizeof(T) == 32)
Result<T> abi_decode_fixed(byte_string_view &enc)
{
    if (SLOTSTORE_UNLIKELY(enc.size() < sizeof(T))) {
        return AbiDecodeError::InputTooShort;
    }
    T value = T::from_bytes(enc.data());
    enc.remove_prefix(sizeof(T));
    return value;
}

// Consumes the 4-byte function selector from the front of `enc`.
inline Result<uint32_t> abi_decode_selector(byte_string_view &enc)
{
    if (SLOTSTORE_UNLIKELY(enc.size() < sizeof(uint32_t))) {
        return AbiDecodeError::InputTooShort;
    }
    auto const selector = intx::be::unsafe::load<uint32_t>(enc.data());
    enc.remove_prefix(sizeof(uint32_t));
    return selector;
}

SLOTSTORE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<slotstore::AbiDecodeError>
    : quick_status_code_from_enum_defaults<slotstore::AbiDecodeError>
{
    static constexpr auto const domain_name = "ABI Decode Error";
    static constexpr auto const domain_uuid =
        "9b0c7a52-2d1e-4f83-b6a4-51e8c03f7d29";

    static std::initializer_list<mapping> const &value_mappings()
    {
        using slotstore::AbiDecodeError;

        static std::initializer_list<mapping> const v = {
            {AbiDecodeError::Success, "success", {errc::success}},
            {AbiDecodeError::InputTooShort, "input too short", {}},
        };
        return v;
    }
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
