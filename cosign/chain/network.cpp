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

#include <cosign/chain/network.hpp>
#include <cosign/core/config.hpp>

#include <cstdint>
#include <string_view>

COSIGN_NAMESPACE_BEGIN

Network network_from_network_id(uint32_t const network_id)
{
    switch (network_id) {
    case MAINNET_ID:
        return mainnet_network();
    case FUJI_ID:
        return fuji_network();
    default:
        return UNDEFINED_NETWORK;
    }
}

std::string_view hrp_from_network_id(uint32_t const network_id)
{
    switch (network_id) {
    case MAINNET_ID:
        return "avax";
    case CASCADE_ID:
        return "cascade";
    case DENALI_ID:
        return "denali";
    case EVEREST_ID:
        return "everest";
    case FUJI_ID:
        return "fuji";
    case UNIT_TEST_ID:
        return "testing";
    case LOCAL_ID:
        return "local";
    default:
        return "custom";
    }
}

std::string_view network_kind_name(NetworkKind const kind)
{
    switch (kind) {
    case NetworkKind::Mainnet:
        return "Mainnet";
    case NetworkKind::Fuji:
        return "Fuji";
    case NetworkKind::Devnet:
        return "Devnet";
    case NetworkKind::Undefined:
        break;
    }
    return "Undefined";
}

COSIGN_NAMESPACE_END
