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

#include <slotstore/core/bytes.hpp>
#include <slotstore/core/int.hpp>
#include <slotstore/execution/contract/big_endian.hpp>
#include <slotstore/execution/contract/storage_variable.hpp>
#include <slotstore/execution/core/address.hpp>
#include <slotstore/execution/state/state.hpp>

#include <gtest/gtest.h>

#include <intx/intx.hpp>

#include <cstdint>

using namespace slotstore;
using namespace intx::literals;

struct Storage : public ::testing::Test
{
    static constexpr auto ADDRESS{
        0x36928500bc1dcd7af6a2b4008875cc336b927d57_address};
    State state;
};

TEST_F(Storage, variable)
{
    StorageVariable<u256_be> var(state, ADDRESS, bytes32_t{6000});
    ASSERT_FALSE(var.load().has_value());
    var.store(u256_be{5});
    ASSERT_TRUE(var.load().has_value());
    EXPECT_EQ(var.load().value().native(), 5);
    var.store(u256_be{2000});
    EXPECT_EQ(var.load().value().native(), 2000);
    var.clear();
    EXPECT_FALSE(var.load().has_value());
    EXPECT_EQ(state.num_slots(ADDRESS), 0);
}

TEST_F(Storage, big_endian_layout)
{
    StorageVariable<u256_be> var(state, ADDRESS, bytes32_t{});
    var.store(u256_be{0x0102_u256});
    auto const raw = state.get_storage(ADDRESS, bytes32_t{});
    EXPECT_EQ(raw, bytes32_t{0x0102});
    EXPECT_EQ(raw.bytes[30], 0x01);
    EXPECT_EQ(raw.bytes[31], 0x02);
}

TEST_F(Storage, struct)
{
    struct S
    {
        uint64_t x;
        uint64_t y;
        u256_be z;
    };

    StorageVariable<S> var(state, ADDRESS, bytes32_t{6000});
    static_assert(decltype(var)::N == 2);

    ASSERT_FALSE(var.load().has_value());
    var.store(S{.x = 4, .y = 5, .z = u256_be{6}});
    ASSERT_TRUE(var.load().has_value());
    EXPECT_EQ(state.num_slots(ADDRESS), 2);

    // the second slot follows the first
    EXPECT_NE(state.get_storage(ADDRESS, bytes32_t{6000}), bytes32_t{});
    EXPECT_NE(state.get_storage(ADDRESS, bytes32_t{6001}), bytes32_t{});

    S const s = var.load().value();
    EXPECT_EQ(s.x, 4);
    EXPECT_EQ(s.y, 5);
    EXPECT_EQ(s.z.native(), 6);
    var.clear();
    EXPECT_FALSE(var.load().has_value());
    EXPECT_EQ(state.num_slots(ADDRESS), 0);
}

TEST_F(Storage, distinct_keys)
{
    StorageVariable<u256_be> a(state, ADDRESS, bytes32_t{1});
    StorageVariable<u256_be> b(state, ADDRESS, bytes32_t{2});
    a.store(u256_be{10});
    b.store(u256_be{20});
    EXPECT_EQ(a.load().value().native(), 10);
    EXPECT_EQ(b.load().value().native(), 20);
}
