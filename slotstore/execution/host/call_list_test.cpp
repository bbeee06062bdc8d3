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

#include <slotstore/core/int.hpp>
#include <slotstore/core/parse_uint256.hpp>
#include <slotstore/execution/contract/abi_encode.hpp>
#include <slotstore/execution/contract/big_endian.hpp>
#include <slotstore/execution/host/call_list.hpp>
#include <slotstore/execution/value_store/value_store_contract.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace slotstore;

TEST(CallList, encodes_in_order)
{
    auto const res = parse_call_list({"set", "42", "get", "set", "0xff"});
    ASSERT_TRUE(res.has_value());
    auto const &calls = res.value();
    ASSERT_EQ(calls.size(), 3);

    EXPECT_FALSE(calls[0].is_get);
    EXPECT_EQ(calls[0].input, abi_encode_call(SET_SELECTOR, u256_be{42}));
    EXPECT_TRUE(calls[1].is_get);
    EXPECT_EQ(calls[1].input, abi_encode_call(GET_SELECTOR));
    EXPECT_FALSE(calls[2].is_get);
    EXPECT_EQ(calls[2].input, abi_encode_call(SET_SELECTOR, u256_be{255}));
}

TEST(CallList, empty)
{
    auto const res = parse_call_list({});
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value().empty());
}

TEST(CallList, set_without_value)
{
    auto const res = parse_call_list({"get", "set"});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), CallListError::MissingValue);
}

TEST(CallList, unknown_call)
{
    auto const res = parse_call_list({"get", "put", "1"});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), CallListError::UnknownCall);
}

TEST(CallList, bad_value)
{
    auto const digit = parse_call_list({"set", "4x2"});
    ASSERT_TRUE(digit.has_error());
    EXPECT_EQ(digit.error(), ParseError::InvalidDigit);

    auto const wide = parse_call_list(
        {"set",
         "0x10000000000000000000000000000000000000000000000000000000000000000"});
    ASSERT_TRUE(wide.has_error());
    EXPECT_EQ(wide.error(), ParseError::DomainViolation);
}
