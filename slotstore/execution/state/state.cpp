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

#include <slotstore/core/assert.h>
#include <slotstore/core/bytes.hpp>
#include <slotstore/core/config.hpp>
#include <slotstore/execution/core/address.hpp>
#include <slotstore/execution/state/state.hpp>

#include <cstddef>
#include <cstdint>

SLOTSTORE_NAMESPACE_BEGIN

bytes32_t
State::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const addr_it = storage_.find(address);
    if (addr_it == storage_.end()) {
        return {};
    }

    auto const value_it = addr_it->second.find(key);
    if (value_it == addr_it->second.end()) {
        return {};
    }

    return value_it->second;
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    if (!checkpoints_.empty()) {
        journal_.emplace_back(address, key, get_storage(address, key));
    }
    put_(address, key, value);
}

size_t State::num_slots(Address const &address) const
{
    auto const it = storage_.find(address);
    return it == storage_.end() ? 0 : it->second.size();
}

void State::checkpoint()
{
    checkpoints_.push_back(journal_.size());
}

void State::commit()
{
    SLOTSTORE_ASSERT(!checkpoints_.empty());

    checkpoints_.pop_back();
    if (checkpoints_.empty()) {
        journal_.clear();
    }
}

void State::revert()
{
    SLOTSTORE_ASSERT(!checkpoints_.empty());

    auto const last_checkpoint = checkpoints_.back();
    checkpoints_.pop_back();

    auto const n_since_last_checkpoint =
        static_cast<int64_t>(journal_.size() - last_checkpoint);

    auto const begin = journal_.rbegin();
    auto const end = journal_.rbegin() + n_since_last_checkpoint;

    for (auto it = begin; it != end; ++it) {
        auto const &[addr, key, value] = *it;
        put_(addr, key, value);
    }

    journal_.erase(
        journal_.begin() + static_cast<int64_t>(last_checkpoint),
        journal_.end());
}

void State::put_(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    if (value == bytes32_t{}) {
        auto const it = storage_.find(address);
        if (it == storage_.end()) {
            return;
        }
        it->second.erase(key);
        if (it->second.empty()) {
            storage_.erase(it);
        }
        return;
    }
    storage_[address][key] = value;
}

SLOTSTORE_NAMESPACE_END
