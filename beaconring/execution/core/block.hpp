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
#include <beaconring/core/config.hpp>
#include <beaconring/execution/core/address.hpp>

#include <cstdint>
#include <optional>

BEACONRING_NAMESPACE_BEGIN

// The header fields the beacon roots system write consumes
struct BlockHeader
{
    uint64_t number{0}; // H_i
    uint64_t timestamp{0}; // H_s

    Address beneficiary{}; // H_c

    std::optional<bytes32_t> parent_beacon_block_root{std::nullopt}; // EIP-4788

    friend bool operator==(BlockHeader const &, BlockHeader const &) = default;
};

BEACONRING_NAMESPACE_END
