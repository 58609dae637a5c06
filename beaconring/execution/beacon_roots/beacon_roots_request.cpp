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
#include <beaconring/execution/beacon_roots/beacon_roots_error.hpp>
#include <beaconring/execution/beacon_roots/beacon_roots_request.hpp>
#include <beaconring/execution/beacon_roots/config.hpp>
#include <beaconring/execution/beacon_roots/constants.hpp>
#include <beaconring/execution/core/address.hpp>
#include <beaconring/execution/core/contract/abi_decode.hpp>
#include <beaconring/execution/core/contract/abi_encode.hpp>
#include <beaconring/execution/core/contract/big_endian.hpp>

#include <intx/intx.hpp>

#include <cstdint>
#include <variant>

BEACONRING_BEACON_ROOTS_ANONYMOUS_NAMESPACE_BEGIN

Result<uint256_t> decode_word(byte_string_view input)
{
    auto const word = abi_decode_fixed<u256_be>(input);
    if (BEACONRING_UNLIKELY(word.has_error() || !input.empty())) {
        return BeaconRootsError::MalformedRequest;
    }
    return word.value().native();
}

BEACONRING_BEACON_ROOTS_ANONYMOUS_NAMESPACE_END

BEACONRING_BEACON_ROOTS_NAMESPACE_BEGIN

Result<Request> decode_request(byte_string_view const input)
{
    if (input.size() == GET_BY_TIMESTAMP_INPUT_SIZE) {
        return Request{
            TimestampLookup{BOOST_OUTCOME_TRYX(decode_word(input))}};
    }

    if (input.size() == GET_COINBASE_INPUT_SIZE) {
        auto const selector =
            intx::be::unsafe::load<uint32_t>(input.substr(0, 4).data());
        if (selector == GET_COINBASE_SELECTOR) {
            return Request{
                StepLookup{BOOST_OUTCOME_TRYX(decode_word(input.substr(4)))}};
        }
    }

    return BeaconRootsError::MalformedRequest;
}

byte_string encode_request(Request const &request)
{
    byte_string output;
    if (auto const *const lookup = std::get_if<StepLookup>(&request)) {
        unsigned char selector[4];
        intx::be::unsafe::store(selector, GET_COINBASE_SELECTOR);
        output.append(selector, sizeof(selector));
        bytes32_t const step = abi_encode_uint(u256_be{lookup->step});
        output.append(step.bytes, sizeof(step));
    }
    else {
        bytes32_t const timestamp = abi_encode_uint(
            u256_be{std::get<TimestampLookup>(request).timestamp});
        output.append(timestamp.bytes, sizeof(timestamp));
    }
    return output;
}

byte_string encode_response(bytes32_t const &hash)
{
    return byte_string{hash.bytes, sizeof(hash)};
}

byte_string encode_response(Address const &address)
{
    bytes32_t const word = abi_encode_address(address);
    return byte_string{word.bytes, sizeof(word)};
}

BEACONRING_BEACON_ROOTS_NAMESPACE_END
