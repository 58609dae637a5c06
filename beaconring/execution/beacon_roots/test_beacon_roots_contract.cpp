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

#include <beaconring/core/byte_string.hpp>
#include <beaconring/core/bytes.hpp>
#include <beaconring/core/int.hpp>
#include <beaconring/core/result.hpp>
#include <beaconring/execution/beacon_roots/beacon_roots_contract.hpp>
#include <beaconring/execution/beacon_roots/beacon_roots_error.hpp>
#include <beaconring/execution/beacon_roots/beacon_roots_request.hpp>
#include <beaconring/execution/beacon_roots/constants.hpp>
#include <beaconring/execution/core/address.hpp>
#include <beaconring/execution/core/block.hpp>
#include <beaconring/execution/core/contract/abi_encode.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>

using namespace beaconring;
using namespace beaconring::beacon_roots;

namespace
{
    constexpr Address reader =
        0xcccccccccccccccccccccccccccccccccccccccc_address;

    bytes32_t root_of(uint64_t const number)
    {
        return bytes32_t{0xbeac0000 + number};
    }

    Address coinbase_of(uint64_t const number)
    {
        return Address{0xc0ffee00 + number};
    }

    BlockHeader header_of(uint64_t const number, uint64_t const timestamp)
    {
        return BlockHeader{
            .number = number,
            .timestamp = timestamp,
            .beneficiary = coinbase_of(number),
            .parent_beacon_block_root = root_of(number)};
    }

    struct BeaconRootsContractTest : public ::testing::Test
    {
        BeaconRootsContract contract{{.history_length = 16}};

        Result<void> set(uint64_t const number, uint64_t const timestamp)
        {
            return set_beacon_root(contract, header_of(number, timestamp));
        }

        Result<byte_string> read(Request const &request)
        {
            return contract.call(reader, encode_request(request), {});
        }

        void expect_root(uint64_t const timestamp, uint64_t const number)
        {
            auto const output = read(TimestampLookup{timestamp});
            ASSERT_TRUE(output.has_value()) << timestamp;
            EXPECT_EQ(output.value(), encode_response(root_of(number)));
        }

        void expect_not_found(uint64_t const timestamp)
        {
            auto const output = read(TimestampLookup{timestamp});
            ASSERT_TRUE(output.has_error()) << timestamp;
            EXPECT_EQ(output.error(), BeaconRootsError::NotFound);
        }
    };
}

TEST_F(BeaconRootsContractTest, defaults)
{
    BeaconRootsContract const defaults;
    EXPECT_EQ(defaults.config().system_address, SYSTEM_ADDRESS);
    EXPECT_TRUE(defaults.config().check_ordering);
    EXPECT_EQ(defaults.store().capacity(), HISTORY_BUFFER_LENGTH);
    EXPECT_EQ(contract.store().capacity(), 16u);
}

TEST_F(BeaconRootsContractTest, system_write_then_read)
{
    BlockHeader const header = header_of(1, 1'700'000'012);
    bytes32_t const root = root_of(1);
    auto const written = contract.call(
        SYSTEM_ADDRESS, byte_string_view{root.bytes, sizeof(root)}, header);
    ASSERT_TRUE(written.has_value());
    EXPECT_TRUE(written.value().empty());

    expect_root(1'700'000'012, 1);

    auto const coinbase = read(StepLookup{1});
    ASSERT_TRUE(coinbase.has_value());
    EXPECT_EQ(coinbase.value(), encode_response(coinbase_of(1)));
    EXPECT_EQ(
        coinbase.value(),
        byte_string(
            abi_encode_address(coinbase_of(1)).bytes, sizeof(bytes32_t)));
}

TEST_F(BeaconRootsContractTest, other_sender_cannot_write)
{
    BlockHeader const header = header_of(1, 100);
    bytes32_t const root = root_of(1);

    // the payload is read as a timestamp lookup
    auto const output = contract.call(
        reader, byte_string_view{root.bytes, sizeof(root)}, header);
    ASSERT_TRUE(output.has_error());
    EXPECT_EQ(output.error(), BeaconRootsError::NotFound);
    expect_not_found(100);
}

TEST_F(BeaconRootsContractTest, history_window)
{
    for (uint64_t number = 1; number <= 40; ++number) {
        ASSERT_FALSE(set(number, 1000 + number * 12).has_error());
    }
    for (uint64_t number = 1; number <= 24; ++number) {
        expect_not_found(1000 + number * 12);
    }
    for (uint64_t number = 25; number <= 40; ++number) {
        expect_root(1000 + number * 12, number);
    }
}

TEST_F(BeaconRootsContractTest, ordering_violation)
{
    ASSERT_FALSE(set(5, 500).has_error());

    auto const same_step = set(5, 600);
    ASSERT_TRUE(same_step.has_error());
    EXPECT_EQ(same_step.error(), BeaconRootsError::OrderingViolation);

    auto const same_timestamp = set(6, 500);
    ASSERT_TRUE(same_timestamp.has_error());
    EXPECT_EQ(same_timestamp.error(), BeaconRootsError::OrderingViolation);

    auto const earlier = set(4, 400);
    ASSERT_TRUE(earlier.has_error());
    EXPECT_EQ(earlier.error(), BeaconRootsError::OrderingViolation);

    // rejected writes leave the store untouched
    expect_root(500, 5);
    expect_not_found(600);
    expect_not_found(400);
    EXPECT_EQ(contract.store().get_address_by_step(5).value(), coinbase_of(5));
    EXPECT_EQ(contract.store().get_address_by_step(4).value(), Address{});

    ASSERT_FALSE(set(6, 512).has_error());
    expect_root(512, 6);
}

TEST(BeaconRootsContract, unchecked_ordering)
{
    BeaconRootsContract contract{
        {.history_length = 16, .check_ordering = false}};
    ASSERT_FALSE(set_beacon_root(contract, header_of(5, 500)).has_error());
    ASSERT_FALSE(set_beacon_root(contract, header_of(4, 400)).has_error());
    ASSERT_FALSE(set_beacon_root(contract, header_of(21, 300)).has_error());

    // step 21 reused the slot of step 5
    EXPECT_EQ(
        contract.store().get_by_timestamp(500).error(),
        BeaconRootsError::NotFound);
    EXPECT_EQ(contract.store().get_by_timestamp(400).value(), root_of(4));
    EXPECT_EQ(contract.store().get_by_timestamp(300).value(), root_of(21));
    EXPECT_EQ(contract.store().get_address_by_step(5).value(), coinbase_of(21));
}

TEST_F(BeaconRootsContractTest, missing_beacon_root)
{
    BlockHeader header = header_of(3, 300);
    header.parent_beacon_block_root = std::nullopt;
    ASSERT_FALSE(set_beacon_root(contract, header).has_error());
    expect_not_found(300);
    EXPECT_EQ(contract.store().get_address_by_step(3).value(), Address{});

    // nothing was accepted, so the same block may still be written
    ASSERT_FALSE(set(3, 300).has_error());
    expect_root(300, 3);
}

TEST_F(BeaconRootsContractTest, malformed_write)
{
    byte_string const short_root(31, 0xab);
    auto const res =
        contract.syscall_set(short_root, header_of(1, 100));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), BeaconRootsError::MalformedRequest);

    byte_string const long_root(33, 0xab);
    auto const output =
        contract.call(SYSTEM_ADDRESS, long_root, header_of(1, 100));
    ASSERT_TRUE(output.has_error());
    EXPECT_EQ(output.error(), BeaconRootsError::MalformedRequest);

    expect_not_found(100);
}

TEST_F(BeaconRootsContractTest, malformed_read)
{
    ASSERT_FALSE(set(1, 100).has_error());
    byte_string input = encode_request(TimestampLookup{100});
    input.push_back(0x00);
    auto const output = contract.call(reader, input, {});
    ASSERT_TRUE(output.has_error());
    EXPECT_EQ(output.error(), BeaconRootsError::MalformedRequest);
}

TEST(BeaconRootsContract, custom_system_address)
{
    constexpr Address authority =
        0x00000000000000000000000000000000000a0b0c_address;
    BeaconRootsContract contract{{.system_address = authority}};
    BlockHeader const header = header_of(7, 700);
    bytes32_t const root = root_of(7);
    byte_string_view const input{root.bytes, sizeof(root)};

    // the default system address is now an ordinary reader
    EXPECT_EQ(
        contract.call(SYSTEM_ADDRESS, input, header).error(),
        BeaconRootsError::NotFound);
    ASSERT_TRUE(contract.call(authority, input, header).has_value());
    EXPECT_EQ(contract.store().get_by_timestamp(700).value(), root);
}
