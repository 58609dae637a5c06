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

#include <beaconring/core/byte_string.hpp>
#include <beaconring/core/int.hpp>
#include <beaconring/core/result.hpp>
#include <beaconring/execution/beacon_roots/config.hpp>
#include <beaconring/execution/beacon_roots/constants.hpp>
#include <beaconring/execution/beacon_roots/ring_store.hpp>
#include <beaconring/execution/core/address.hpp>

#include <cstdint>
#include <optional>

BEACONRING_NAMESPACE_BEGIN

struct BlockHeader;

BEACONRING_NAMESPACE_END

BEACONRING_BEACON_ROOTS_NAMESPACE_BEGIN

struct BeaconRootsConfig
{
    // the only caller allowed to write
    Address system_address{SYSTEM_ADDRESS};
    uint64_t history_length{HISTORY_BUFFER_LENGTH};
    // reject writes whose step or timestamp does not increase
    bool check_ordering{true};
};

class BeaconRootsContract
{
    struct Watermark
    {
        uint256_t step;
        uint256_t timestamp;
    };

    BeaconRootsConfig const config_;
    RingStore store_;
    std::optional<Watermark> last_;

public:
    explicit BeaconRootsContract(BeaconRootsConfig const & = {});

    BeaconRootsConfig const &config() const noexcept
    {
        return config_;
    }

    RingStore const &store() const noexcept
    {
        return store_;
    }

    // Routes by caller: the system address writes, everyone else reads
    Result<byte_string>
    call(Address const &sender, byte_string_view input, BlockHeader const &);

    // Records the 32 byte root in `input` against the header's number,
    // timestamp and beneficiary
    Result<void> syscall_set(byte_string_view input, BlockHeader const &);

    Result<byte_string> get(byte_string_view input) const;
};

// Start of block system write. A header without a parent beacon block root
// records nothing.
Result<void> set_beacon_root(BeaconRootsContract &, BlockHeader const &);

BEACONRING_BEACON_ROOTS_NAMESPACE_END
