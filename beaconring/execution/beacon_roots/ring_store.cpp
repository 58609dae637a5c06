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

#include <beaconring/core/assert.h>
#include <beaconring/core/bytes.hpp>
#include <beaconring/core/int.hpp>
#include <beaconring/core/likely.h>
#include <beaconring/core/result.hpp>
#include <beaconring/execution/beacon_roots/beacon_roots_error.hpp>
#include <beaconring/execution/beacon_roots/config.hpp>
#include <beaconring/execution/beacon_roots/ring_store.hpp>
#include <beaconring/execution/core/address.hpp>

#include <atomic>
#include <cstdint>
#include <memory>

BEACONRING_BEACON_ROOTS_ANONYMOUS_NAMESPACE_BEGIN

inline void cpu_relax()
{
#if defined(__x86_64__)
    __builtin_ia32_pause();
#endif
}

bytes32_t to_index_key(uint256_t const &timestamp)
{
    return to_bytes(to_big_endian(timestamp));
}

BEACONRING_BEACON_ROOTS_ANONYMOUS_NAMESPACE_END

BEACONRING_BEACON_ROOTS_NAMESPACE_BEGIN

RingStore::RingStore(RingStoreConfig const &config)
    : capacity_{config.capacity}
    , slots_{std::make_unique<Slot[]>(config.capacity)}
{
    BEACONRING_ASSERT(capacity_ > 0, "ring store capacity must be positive");
}

uint64_t RingStore::slot_index(uint256_t const &step) const
{
    return static_cast<uint64_t>(step % uint256_t{capacity_});
}

RingStore::Entry RingStore::load(uint256_t const &step) const
{
    Slot const &slot = slots_[slot_index(step)];
    for (;;) {
        uint64_t const seqno = slot.seqno.load(std::memory_order_acquire);
        if (BEACONRING_LIKELY(!(seqno & 1))) {
            Entry const entry{slot.timestamp, slot.hash, slot.address};
            std::atomic_thread_fence(std::memory_order_acquire);
            if (BEACONRING_LIKELY(
                    slot.seqno.load(std::memory_order_relaxed) == seqno)) {
                return entry;
            }
        }
        // writer is mid-update of this slot
        cpu_relax();
    }
}

void RingStore::record(
    uint256_t const &step, uint256_t const &timestamp, bytes32_t const &hash,
    Address const &address)
{
    Slot &slot = slots_[slot_index(step)];
    uint64_t const seqno = slot.seqno.load(std::memory_order_relaxed);
    slot.seqno.store(seqno + 1, std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_release);
    slot.timestamp = timestamp;
    slot.hash = hash;
    slot.address = address;
    slot.seqno.store(seqno + 2, std::memory_order_release);

    // Index only after the slot is published, so a reader that finds the
    // timestamp also finds the slot contents that go with it
    TimestampIndex::accessor it;
    index_.insert(it, to_index_key(timestamp));
    it->second = step;
}

Result<bytes32_t> RingStore::get_by_timestamp(uint256_t const &timestamp) const
{
    if (BEACONRING_UNLIKELY(timestamp == 0)) {
        return BeaconRootsError::NotFound;
    }

    uint256_t step;
    {
        TimestampIndex::const_accessor it;
        if (!index_.find(it, to_index_key(timestamp))) {
            return BeaconRootsError::NotFound;
        }
        step = it->second;
    }

    // a later step may have reused the slot
    Entry const entry = load(step);
    if (BEACONRING_UNLIKELY(entry.timestamp != timestamp)) {
        return BeaconRootsError::NotFound;
    }
    return entry.hash;
}

Result<Address> RingStore::get_address_by_step(uint256_t const &step) const
{
    return load(step).address;
}

BEACONRING_BEACON_ROOTS_NAMESPACE_END
