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

#include <gtest/gtest.h>

using namespace cosign;

TEST(Network, Hrp)
{
    EXPECT_EQ(hrp_from_network_id(1), "avax");
    EXPECT_EQ(hrp_from_network_id(2), "cascade");
    EXPECT_EQ(hrp_from_network_id(3), "denali");
    EXPECT_EQ(hrp_from_network_id(4), "everest");
    EXPECT_EQ(hrp_from_network_id(5), "fuji");
    EXPECT_EQ(hrp_from_network_id(10), "testing");
    EXPECT_EQ(hrp_from_network_id(12345), "local");
    EXPECT_EQ(hrp_from_network_id(0), "custom");
    EXPECT_EQ(hrp_from_network_id(1337), "custom");
}

TEST(Network, FromNetworkId)
{
    auto const mainnet = network_from_network_id(MAINNET_ID);
    EXPECT_EQ(mainnet.kind, NetworkKind::Mainnet);
    EXPECT_EQ(mainnet.id, 1);
    EXPECT_EQ(mainnet.endpoint, "https://api.avax.network");

    auto const fuji = network_from_network_id(FUJI_ID);
    EXPECT_EQ(fuji.kind, NetworkKind::Fuji);
    EXPECT_EQ(fuji.endpoint, "https://api.avax-test.network");

    EXPECT_EQ(network_from_network_id(LOCAL_ID), UNDEFINED_NETWORK);
    EXPECT_EQ(network_from_network_id(0), UNDEFINED_NETWORK);
    EXPECT_EQ(network_kind_name(NetworkKind::Devnet), "Devnet");
}
