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

// status-code include paths differ between Boost versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BEACONRING_BEACON_ROOTS_NAMESPACE_BEGIN

enum class BeaconRootsError
{
    Success = 0,
    NotFound,
    MalformedRequest,
    OrderingViolation,
};

BEACONRING_BEACON_ROOTS_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<beaconring::beacon_roots::BeaconRootsError>
    : quick_status_code_from_enum_defaults<
          beaconring::beacon_roots::BeaconRootsError>
{
    static constexpr auto const domain_name = "Beacon Roots Error";
    static constexpr auto const domain_uuid =
        "6b1d93c4-5f0e-4a27-b8d3-2c9e71a40f15";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
