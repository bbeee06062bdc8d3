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
#include <slotstore/core/config.hpp>
#include <slotstore/core/int.hpp>
#include <slotstore/core/log_level_map.hpp>
#include <slotstore/execution/contract/big_endian.hpp>
#include <slotstore/execution/core/address.hpp>
#include <slotstore/execution/host/call_list.hpp>
#include <slotstore/execution/host/value_store_host.hpp>
#include <slotstore/execution/state/state.hpp>
#include <slotstore/execution/value_store/value_store_contract.hpp>

#include <CLI/CLI.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <fmt/core.h>

#include <intx/intx.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

using namespace slotstore;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"slotstore"};
    cli.option_defaults()->always_capture_default();

    std::string address_hex = "0x1000";
    std::string sender_hex = "0xdeadbeef";
    int64_t gas = 100'000;
    auto log_level = quill::LogLevel::Info;
    std::vector<std::string> call_args;

    cli.add_option("--address", address_hex, "address of the store account");
    cli.add_option("--sender", sender_hex, "address making the calls");
    cli.add_option("--gas", gas, "gas limit of each call")
        ->check(CLI::NonNegativeNumber);
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_option(
           "calls",
           call_args,
           "calls to run in order, e.g. `set 42 get set 0xff get`")
        ->required();

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    auto const address = evmc::from_hex<Address>(address_hex);
    auto const sender = evmc::from_hex<Address>(sender_hex);
    if (!address.has_value() || !sender.has_value()) {
        LOG_ERROR(
            "invalid address: --address {} --sender {}",
            address_hex,
            sender_hex);
        return EXIT_FAILURE;
    }

    auto const calls = parse_call_list(call_args);
    if (calls.has_error()) {
        LOG_ERROR("invalid calls: {}", calls.error().message().c_str());
        return EXIT_FAILURE;
    }

    State state;
    ValueStoreHost host{state, address.value()};

    LOG_INFO(
        "running {} calls against store 0x{}",
        calls.value().size(),
        evmc::hex(evmc::bytes_view{
            host.address().bytes, sizeof(host.address().bytes)}));

    uint64_t total_gas = 0;
    for (auto const &call : calls.value()) {
        evmc_message const msg{
            .kind = EVMC_CALL,
            .flags = 0,
            .depth = 0,
            .gas = gas,
            .recipient = address.value(),
            .sender = sender.value(),
            .input_data = call.input.data(),
            .input_size = call.input.size(),
            .value = {},
            .create2_salt = {},
            .code_address = address.value(),
            .code = nullptr,
            .code_size = 0,
        };
        auto const res = host.call(msg);
        if (res.has_error()) {
            LOG_ERROR("call failed: {}", res.error().message().c_str());
            return EXIT_FAILURE;
        }
        total_gas += res.value().gas_used;
        if (call.is_get) {
            auto const value = u256_be::from_bytes(res.value().output.data());
            fmt::print("{}\n", intx::to_string(value.native()));
        }
    }

    LOG_INFO("done, gas used {}", total_gas);
    return EXIT_SUCCESS;
}
