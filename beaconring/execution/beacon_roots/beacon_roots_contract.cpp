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
#include <beaconring/core/likely.h>
#include <beaconring/core/result.hpp>
#include <beaconring/execution/beacon_roots/beacon_roots_contract.hpp>
#include <beaconring/execution/beacon_roots/beacon_roots_error.hpp>
#include <beaconring/execution/beacon_roots/beacon_roots_request.hpp>
#include <beaconring/execution/beacon_roots/config.hpp>
#include <beaconring/execution/beacon_roots/constants.hpp>
#include <beaconring/execution/core/address.hpp>
#include <beaconring/execution/core/block.hpp>
#include <beaconring/execution/core/fmt/address_fmt.hpp>
#include <beaconring/execution/core/fmt/bytes_fmt.hpp>
#include <beaconring/execution/core/fmt/int_fmt.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstring>
#include <variant>

BEACONRING_BEACON_ROOTS_NAMESPACE_BEGIN

BeaconRootsContract::BeaconRootsContract(BeaconRootsConfig const &config)
    : config_{config}
    , store_{RingStoreConfig{.capacity = config.history_length}}
{
    LOG_INFO(
        "Beacon roots contract at {}: history length {}, system address {}, "
        "ordering checks {}",
        BEACON_ROOTS_ADDRESS,
        store_.capacity(),
        config_.system_address,
        config_.check_ordering ? "on" : "off");
}

Result<byte_string> BeaconRootsContract::call(
    Address const &sender, byte_string_view const input,
    BlockHeader const &header)
{
    if (sender == config_.system_address) {
        BOOST_OUTCOME_TRYV(syscall_set(input, header));
        return byte_string{};
    }
    return get(input);
}

Result<void> BeaconRootsContract::syscall_set(
    byte_string_view const input, BlockHeader const &header)
{
    if (BEACONRING_UNLIKELY(input.size() != sizeof(bytes32_t))) {
        LOG_ERROR(
            "Invalid beacon root write at block {}: expected {} bytes, got {}",
            header.number,
            sizeof(bytes32_t),
            input.size());
        return BeaconRootsError::MalformedRequest;
    }

    bytes32_t root;
    std::memcpy(root.bytes, input.data(), sizeof(root));

    uint256_t const step{header.number};
    uint256_t const timestamp{header.timestamp};
    if (config_.check_ordering && last_.has_value() &&
        BEACONRING_UNLIKELY(
            step <= last_->step || timestamp <= last_->timestamp)) {
        LOG_ERROR(
            "Out of order beacon root {}: block {} at {} does not follow "
            "block {} at {}",
            root,
            step,
            timestamp,
            last_->step,
            last_->timestamp);
        return BeaconRootsError::OrderingViolation;
    }

    store_.record(step, timestamp, root, header.beneficiary);
    last_ = Watermark{.step = step, .timestamp = timestamp};
    return outcome::success();
}

Result<byte_string> BeaconRootsContract::get(byte_string_view const input) const
{
    auto const request = BOOST_OUTCOME_TRYX(decode_request(input));
    if (auto const *const lookup = std::get_if<StepLookup>(&request)) {
        return encode_response(
            BOOST_OUTCOME_TRYX(store_.get_address_by_step(lookup->step)));
    }
    return encode_response(BOOST_OUTCOME_TRYX(store_.get_by_timestamp(
        std::get<TimestampLookup>(request).timestamp)));
}

Result<void>
set_beacon_root(BeaconRootsContract &contract, BlockHeader const &header)
{
    if (!header.parent_beacon_block_root.has_value()) {
        return outcome::success();
    }
    bytes32_t const &root = header.parent_beacon_block_root.value();
    return contract.syscall_set(
        byte_string_view{root.bytes, sizeof(root)}, header);
}

BEACONRING_BEACON_ROOTS_NAMESPACE_END
