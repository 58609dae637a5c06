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
#include <beaconring/core/bytes.hpp>
#include <beaconring/core/int.hpp>
#include <beaconring/core/result.hpp>
#include <beaconring/execution/beacon_roots/config.hpp>
#include <beaconring/execution/core/address.hpp>

#include <variant>

BEACONRING_BEACON_ROOTS_NAMESPACE_BEGIN

// Bare 32 byte big endian timestamp
struct TimestampLookup
{
    uint256_t timestamp;

    friend bool operator==(TimestampLookup const &, TimestampLookup const &) =
        default;
};

// getCoinbase(uint256) selector followed by a 32 byte big endian step
struct StepLookup
{
    uint256_t step;

    friend bool
    operator==(StepLookup const &, StepLookup const &) = default;
};

using Request = std::variant<TimestampLookup, StepLookup>;

// Classifies a read by its exact length. Anything other than a 32 byte
// timestamp or a 36 byte getCoinbase call is a MalformedRequest.
Result<Request> decode_request(byte_string_view input);

byte_string encode_request(Request const &);

byte_string encode_response(bytes32_t const &hash);
byte_string encode_response(Address const &address);

BEACONRING_BEACON_ROOTS_NAMESPACE_END
