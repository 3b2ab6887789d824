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

#include <cosign/core/config.hpp>

#include <chrono>
#include <cstdint>
#include <string_view>

COSIGN_NAMESPACE_BEGIN

inline constexpr uint32_t MAINNET_ID = 1;
inline constexpr uint32_t CASCADE_ID = 2;
inline constexpr uint32_t DENALI_ID = 3;
inline constexpr uint32_t EVEREST_ID = 4;
inline constexpr uint32_t FUJI_ID = 5;
inline constexpr uint32_t UNIT_TEST_ID = 10;
inline constexpr uint32_t LOCAL_ID = 12345;

// returned for proposal transactions and unclassified bytes
inline constexpr uint32_t UNKNOWN_NETWORK_ID = 0;

inline constexpr std::string_view FUJI_API_ENDPOINT =
    "https://api.avax-test.network";
inline constexpr std::string_view MAINNET_API_ENDPOINT =
    "https://api.avax.network";

inline constexpr std::chrono::seconds API_REQUEST_TIMEOUT{30};
inline constexpr std::chrono::minutes API_REQUEST_LARGE_TIMEOUT{2};

enum class NetworkKind : uint8_t
{
    Undefined = 0,
    Mainnet,
    Fuji,
    Devnet,
};

struct Network
{
    NetworkKind kind{NetworkKind::Undefined};
    uint32_t id{};
    std::string_view endpoint{};

    friend bool operator==(Network const &, Network const &) = default;
};

inline constexpr Network UNDEFINED_NETWORK{};

constexpr Network mainnet_network()
{
    return {NetworkKind::Mainnet, MAINNET_ID, MAINNET_API_ENDPOINT};
}

constexpr Network fuji_network()
{
    return {NetworkKind::Fuji, FUJI_ID, FUJI_API_ENDPOINT};
}

/// Only the public networks have a known endpoint; every other id maps to
/// UNDEFINED_NETWORK
Network network_from_network_id(uint32_t);

/// Human readable part of bech32 addresses on the given network, "custom"
/// for ids that are not well known
std::string_view hrp_from_network_id(uint32_t);

std::string_view network_kind_name(NetworkKind);

COSIGN_NAMESPACE_END
