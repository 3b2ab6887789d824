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

#include <cosign/chain/components.hpp>
#include <cosign/chain/pchain/transaction.hpp>
#include <cosign/chain/pchain/transaction_info.hpp>
#include <cosign/chain/test/sample_transactions.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <string_view>
#include <variant>

using namespace cosign;
using namespace cosign::pchain;
using namespace cosign::test;

TEST(PChainTransactionInfo, NetworkId)
{
    for (auto const &tx : every_kind<UnsignedTransaction>(12345)) {
        if (std::holds_alternative<AdvanceTimeTx>(tx) ||
            std::holds_alternative<RewardValidatorTx>(tx)) {
            EXPECT_EQ(network_id(tx), 0) << kind_name(tx);
            EXPECT_FALSE(blockchain_id(tx).has_value());
            EXPECT_EQ(hrp(tx), "custom");
        }
        else {
            EXPECT_EQ(network_id(tx), 12345) << kind_name(tx);
            EXPECT_EQ(blockchain_id(tx), filled_id(0x11));
            EXPECT_EQ(hrp(tx), "local");
        }
    }
}

TEST(PChainTransactionInfo, KindName)
{
    EXPECT_EQ(kind_name(CreateChainTx{}), "CreateChainTx");
    EXPECT_EQ(kind_name(BaseTransactionTx{}), "BaseTx");
    EXPECT_EQ(kind_name(DisableL1ValidatorTx{}), "DisableL1ValidatorTx");
    EXPECT_EQ(every_kind<UnsignedTransaction>(1).size(), 20);
}

TEST(PChainTransactionInfo, SubnetGovernanceKinds)
{
    size_t governed = 0;
    for (auto const &tx : every_kind<UnsignedTransaction>(5)) {
        auto const auth = subnet_auth(tx);
        EXPECT_EQ(auth.has_value(), is_subnet_governance(tx)) << kind_name(tx);
        if (auth.has_value()) {
            ++governed;
            EXPECT_EQ(auth->signature_indices, std::vector<uint32_t>{0});
            EXPECT_EQ(subnet_id(tx), SAMPLE_SUBNET_ID);
        }
    }
    EXPECT_EQ(governed, 6);

    EXPECT_FALSE(is_subnet_governance(CreateSubnetTx{}));
    EXPECT_FALSE(subnet_id(CreateSubnetTx{}).has_value());
    EXPECT_TRUE(is_subnet_governance(ConvertSubnetToL1Tx{}));
}
