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

#include <beaconring/execution/beacon_roots/config.hpp>
#include <beaconring/execution/core/address.hpp>
#include <beaconring/execution/core/contract/abi_signatures.hpp>

#include <cstddef>
#include <cstdint>

BEACONRING_BEACON_ROOTS_NAMESPACE_BEGIN

// EIP-4788
inline constexpr Address BEACON_ROOTS_ADDRESS{
    0x000F3df6D732807Ef1319fB7B8bB8522d0Beac02_address};

// Caller identity of the per-block system write
inline constexpr Address SYSTEM_ADDRESS{
    0xfffffffffffffffffffffffffffffffffffffffe_address};

inline constexpr uint64_t HISTORY_BUFFER_LENGTH{8191};

// 32 byte argument, no selector
inline constexpr size_t GET_BY_TIMESTAMP_INPUT_SIZE{32};

// 4 byte selector followed by one 32 byte argument
inline constexpr size_t GET_COINBASE_INPUT_SIZE{36};

inline constexpr uint32_t GET_COINBASE_SELECTOR =
    abi_encode_selector("getCoinbase(uint256)");

BEACONRING_BEACON_ROOTS_NAMESPACE_END
