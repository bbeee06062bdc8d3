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
#include <slotstore/core/unordered_map.hpp>
#include <slotstore/execution/core/address.hpp>

#include <cstddef>
#include <vector>

SLOTSTORE_NAMESPACE_BEGIN

/**
 * Account storage of the host: one word-to-word map per address.
 *
 * Invariants (enforced by the host using the state):
 * - Each call to `checkpoint()` is followed by exactly one call to `commit()`
 *   or to `revert()`
 * - A slot holding the zero word is not stored
 */
class State
{
    struct JournalEntry
    {
        Address address;
        bytes32_t key;
        bytes32_t previous_value;
    };

    using StorageMap = unordered_dense_map<bytes32_t, bytes32_t>;

public:
    State() = default;

    State(State &&) = default;
    State(State const &) = delete;
    State &operator=(State &&) = default;
    State &operator=(State const &) = delete;

    /**
     * Get the current value of a slot, or the zero word if it has never been
     * written.
     */
    bytes32_t get_storage(Address const &, bytes32_t const &key) const;

    /**
     * Write a slot, recording the previous value so the write can be rolled
     * back. Writing the zero word deletes the slot.
     */
    void set_storage(
        Address const &, bytes32_t const &key, bytes32_t const &value);

    /**
     * Number of non-zero slots held by an address.
     */
    size_t num_slots(Address const &) const;

    void checkpoint();

    /**
     * Keep every write since the last checkpoint.
     */
    void commit();

    /**
     * Undo every write since the last checkpoint, newest first.
     */
    void revert();

private:
    void put_(Address const &, bytes32_t const &key, bytes32_t const &value);

    std::vector<JournalEntry> journal_{};

    std::vector<size_t> checkpoints_{};

    unordered_dense_map<Address, StorageMap> storage_{};
};

SLOTSTORE_NAMESPACE_END
