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

#include <beaconring/core/bytes.hpp>
#include <beaconring/core/bytes_hash_compare.hpp>
#include <beaconring/core/int.hpp>
#include <beaconring/core/result.hpp>
#include <beaconring/execution/beacon_roots/config.hpp>
#include <beaconring/execution/beacon_roots/constants.hpp>
#include <beaconring/execution/core/address.hpp>

#include <oneapi/tbb/concurrent_hash_map.h>

#include <atomic>
#include <cstdint>
#include <memory>

BEACONRING_BEACON_ROOTS_NAMESPACE_BEGIN

struct RingStoreConfig
{
    uint64_t capacity{HISTORY_BUFFER_LENGTH};
};

/**
 * Fixed capacity history of beacon roots, keyed by step.
 *
 * Step `s` lives in slot `s % capacity` and replaces whatever step held the
 * slot before it. Timestamps are additionally indexed to the step that last
 * recorded them. The index is never pruned, so a timestamp lookup confirms
 * against the slot's own timestamp before answering.
 *
 * There is a single writer. Readers may run on any number of threads,
 * concurrently with the writer, and never observe a partially written slot.
 */
class RingStore
{
    struct Slot
    {
        // odd while the writer is updating the fields below
        std::atomic<uint64_t> seqno{0};
        uint256_t timestamp{};
        bytes32_t hash{};
        Address address{};
    };

    struct Entry
    {
        uint256_t timestamp;
        bytes32_t hash;
        Address address;
    };

    using TimestampIndex = oneapi::tbb::concurrent_hash_map<
        bytes32_t, uint256_t, BytesHashCompare<bytes32_t>>;

    uint64_t const capacity_;
    std::unique_ptr<Slot[]> slots_;
    TimestampIndex index_;

    uint64_t slot_index(uint256_t const &step) const;
    Entry load(uint256_t const &step) const;

public:
    explicit RingStore(RingStoreConfig const & = {});

    RingStore(RingStore const &) = delete;
    RingStore &operator=(RingStore const &) = delete;

    uint64_t capacity() const noexcept
    {
        return capacity_;
    }

    // Unconditionally overwrites slot `step % capacity`. Callers own ordering.
    void record(
        uint256_t const &step, uint256_t const &timestamp,
        bytes32_t const &hash, Address const &address);

    Result<bytes32_t> get_by_timestamp(uint256_t const &timestamp) const;

    // Returns whatever address occupies the slot, which may belong to any
    // step congruent to `step`, or be zero if the slot was never written.
    Result<Address> get_address_by_step(uint256_t const &step) const;
};

BEACONRING_BEACON_ROOTS_NAMESPACE_END
