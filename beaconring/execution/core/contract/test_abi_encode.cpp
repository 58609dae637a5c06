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

#include <beaconring/core/bytes.hpp>
#include <beaconring/core/int.hpp>
#include <beaconring/execution/core/address.hpp>
#include <beaconring/execution/core/contract/abi_encode.hpp>
#include <beaconring/execution/core/contract/abi_signatures.hpp>
#include <beaconring/execution/core/contract/big_endian.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace beaconring;
using namespace intx::literals;

TEST(AbiEncode, u64)
{
    constexpr u64_be input{1'700'000'012};
    constexpr auto expected =
        evmc::from_hex<bytes32_t>(
            "000000000000000000000000000000000000000000000000000000006553f10c")
            .value();
    constexpr auto actual = abi_encode_uint(input);
    EXPECT_EQ(actual, expected);
}

TEST(AbiEncode, u256)
{
    constexpr u256_be input{15355346523654236542356453_u256};
    constexpr auto expected =
        evmc::from_hex<bytes32_t>(
            "0x0000000000000000000000000000000000000000000cb3"
            "9f00c54ee156444be5")
            .value();
    constexpr auto actual = abi_encode_uint(input);
    EXPECT_EQ(actual, expected);
}

TEST(AbiEncode, address)
{
    constexpr Address input{0xDEADBEEF000000000000000000F00D0000000100_address};
    constexpr auto expected =
        evmc::from_hex<bytes32_t>(
            "000000000000000000000000deadbeef000000000000000000f00d0000000100")
            .value();
    constexpr auto actual = abi_encode_address(input);
    EXPECT_EQ(actual, expected);
}

TEST(AbiEncode, selector)
{
    static_assert(
        abi_encode_selector("transfer(address,uint256)") == 0xa9059cbb);
    static_assert(abi_encode_selector("balanceOf(address)") == 0x70a08231);
}
