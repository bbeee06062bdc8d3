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

#include <slotstore/core/byte_string.hpp>
#include <slotstore/core/int.hpp>
#include <slotstore/execution/contract/abi_encode.hpp>
#include <slotstore/execution/contract/big_endian.hpp>
#include <slotstore/execution/core/address.hpp>
#include <slotstore/execution/host/value_store_host.hpp>
#include <slotstore/execution/state/state.hpp>
#include <slotstore/execution/value_store/value_store.hpp>
#include <slotstore/execution/value_store/value_store_contract.hpp>
#include <slotstore/execution/value_store/value_store_error.hpp>

#include <evmc/evmc.h>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <algorithm>
#include <cstdint>
#include <thread>
#include <vector>

using namespace slotstore;
using namespace intx::literals;

namespace
{
    constexpr auto sender = Address{0xcafebabe};

    evmc_message make_call(
        Address const &recipient, byte_string const &input,
        int64_t const gas = 100'000)
    {
        return evmc_message{
            .kind = EVMC_CALL,
            .flags = 0,
            .depth = 0,
            .gas = gas,
            .recipient = recipient,
            .sender = sender,
            .input_data = input.data(),
            .input_size = input.size(),
            .value = {},
            .create2_salt = {},
            .code_address = recipient,
            .code = nullptr,
            .code_size = 0,
        };
    }
}

struct ValueStoreHostTest : public ::testing::Test
{
    State state;
    ValueStoreHost host{state, VALUE_STORE_CA};

    Result<CallOutput> set(uint256_t const &x, int64_t const gas = 100'000)
    {
        auto const input = abi_encode_call(SET_SELECTOR, u256_be{x});
        return host.call(make_call(VALUE_STORE_CA, input, gas));
    }

    uint256_t get()
    {
        auto const input = abi_encode_call(GET_SELECTOR);
        auto const res = host.call(make_call(VALUE_STORE_CA, input));
        EXPECT_TRUE(res.has_value());
        EXPECT_EQ(res.value().output.size(), 32);
        EXPECT_EQ(res.value().gas_used, 2100);
        return u256_be::from_bytes(res.value().output.data()).native();
    }
};

TEST_F(ValueStoreHostTest, bound_to_store_address)
{
    EXPECT_EQ(host.address(), VALUE_STORE_CA);

    State other_state;
    ValueStoreHost other{other_state, Address{0x2000}};
    EXPECT_EQ(other.address(), Address{0x2000});

    auto const input = abi_encode_call(GET_SELECTOR);
    EXPECT_TRUE(other.call(make_call(other.address(), input)).has_value());
    EXPECT_FALSE(other.call(make_call(host.address(), input)).has_value());
}

TEST_F(ValueStoreHostTest, new_store_reads_zero)
{
    EXPECT_EQ(get(), 0);
}

TEST_F(ValueStoreHostTest, set_then_get)
{
    auto const res = set(42);
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value().output.empty());
    EXPECT_EQ(res.value().gas_used, 22100);
    EXPECT_EQ(get(), 42);
}

TEST_F(ValueStoreHostTest, overwrite)
{
    ASSERT_TRUE(set(42));
    ASSERT_TRUE(set(7));
    EXPECT_EQ(get(), 7);
}

TEST_F(ValueStoreHostTest, max_value)
{
    ASSERT_TRUE(set(UINT256_MAX));
    EXPECT_EQ(get(), UINT256_MAX);
}

TEST_F(ValueStoreHostTest, unknown_recipient)
{
    auto const input = abi_encode_call(SET_SELECTOR, u256_be{42});
    auto const res = host.call(make_call(Address{0x2000}, input));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ValueStoreError::UnknownRecipient);
    EXPECT_EQ(get(), 0);
}

TEST_F(ValueStoreHostTest, out_of_gas)
{
    auto const res = set(42, 22099);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ValueStoreError::OutOfGas);
    EXPECT_EQ(get(), 0);

    auto const negative = set(42, -1);
    ASSERT_TRUE(negative.has_error());
    EXPECT_EQ(negative.error(), ValueStoreError::OutOfGas);

    ASSERT_TRUE(set(42, 22100));
    EXPECT_EQ(get(), 42);
}

TEST_F(ValueStoreHostTest, failed_call_leaves_state)
{
    ASSERT_TRUE(set(5));

    auto const input = abi_encode_call(SET_SELECTOR, u256_be{9}, u256_be{9});
    auto const res = host.call(make_call(VALUE_STORE_CA, input));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ValueStoreError::InvalidInput);
    EXPECT_EQ(get(), 5);
    EXPECT_EQ(state.num_slots(VALUE_STORE_CA), 1);

    byte_string const unknown = abi_encode_call(0xffffffff);
    auto const fallback = host.call(make_call(VALUE_STORE_CA, unknown));
    ASSERT_TRUE(fallback.has_error());
    EXPECT_EQ(fallback.error(), ValueStoreError::MethodNotSupported);
    EXPECT_EQ(get(), 5);
}

TEST_F(ValueStoreHostTest, concurrent_callers)
{
    constexpr unsigned NUM_THREADS = 8;
    constexpr unsigned NUM_CALLS = 500;

    std::vector<std::thread> threads;
    for (unsigned t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([this, t] {
            auto const get_input = abi_encode_call(GET_SELECTOR);
            for (unsigned i = 0; i < NUM_CALLS; ++i) {
                uint256_t const x = uint256_t{t} << 128 | i;
                auto const set_input = abi_encode_call(SET_SELECTOR, u256_be{x});
                auto const set_res =
                    host.call(make_call(VALUE_STORE_CA, set_input));
                ASSERT_TRUE(set_res.has_value());

                auto const get_res =
                    host.call(make_call(VALUE_STORE_CA, get_input));
                ASSERT_TRUE(get_res.has_value());
                auto const seen =
                    u256_be::from_bytes(get_res.value().output.data())
                        .native();
                // every observed value was written by some caller
                EXPECT_LT(seen >> 128, NUM_THREADS);
                EXPECT_LT(static_cast<uint64_t>(seen), NUM_CALLS);
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    auto const last = get();
    EXPECT_EQ(static_cast<uint64_t>(last), NUM_CALLS - 1);
    EXPECT_EQ(state.num_slots(VALUE_STORE_CA), 1);
}
