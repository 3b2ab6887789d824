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

#include <cosign/chain/cchain/transaction.hpp>
#include <cosign/chain/cchain/transaction_codec.hpp>
#include <cosign/chain/credential.hpp>
#include <cosign/chain/detect_chain.hpp>
#include <cosign/chain/pchain/signed_transaction.hpp>
#include <cosign/chain/pchain/transaction.hpp>
#include <cosign/chain/pchain/transaction_codec.hpp>
#include <cosign/chain/pchain/transaction_info.hpp>
#include <cosign/chain/test/sample_transactions.hpp>
#include <cosign/chain/xchain/transaction.hpp>
#include <cosign/chain/xchain/transaction_codec.hpp>
#include <cosign/chain/xchain/transaction_info.hpp>
#include <cosign/core/byte_string.hpp>

#include <evmc/hex.hpp>

#include <gtest/gtest.h>

#include <array>
#include <cstring>
#include <vector>

using namespace cosign;
using namespace cosign::test;

namespace
{
    // An X-chain BaseTx with no outputs, no inputs and a 28 byte memo has
    // exactly the shape of a C-chain ImportTx whose source chain begins with
    // 00000000 00000000 0000001c, provided the memo ends in eight zeroes.
    xchain::BaseTransactionTx colliding_xchain_tx(uint32_t const network_id)
    {
        xchain::BaseTransactionTx tx;
        tx.base.network_id = network_id;
        tx.base.blockchain_id = filled_id(0x11);
        tx.base.memo = byte_string(20, 0x42) + byte_string(8, 0x00);
        return tx;
    }
}

TEST(DetectChain, ChainTagName)
{
    EXPECT_EQ(chain_tag_name(ChainTag::PChain), "P");
    EXPECT_EQ(chain_tag_name(ChainTag::XChain), "X");
    EXPECT_EQ(chain_tag_name(ChainTag::CChain), "C");
    EXPECT_EQ(chain_tag_name(ChainTag::Undefined), "undefined");
    EXPECT_EQ(chain_tag_name(static_cast<ChainTag>(99)), "undefined");
}

TEST(DetectChain, Garbage)
{
    for (auto const *hex :
         {"", "01020304", "ff", "00010203040506070809", "0000303900000001"}) {
        auto const bytes = evmc::from_hex(hex).value_or(byte_string{});
        EXPECT_EQ(detect_chain(bytes), ChainTag::Undefined) << hex;
        EXPECT_EQ(extract_network_id(bytes), 0) << hex;
    }
}

TEST(DetectChain, EveryPChainKind)
{
    for (auto const &tx : every_kind<pchain::UnsignedTransaction>(5)) {
        auto const encoding = pchain::encode_unsigned_transaction(tx);
        EXPECT_EQ(detect_chain(encoding), ChainTag::PChain)
            << pchain::kind_name(tx);
        EXPECT_EQ(extract_network_id(encoding), pchain::network_id(tx))
            << pchain::kind_name(tx);
    }
}

TEST(DetectChain, EveryXChainKind)
{
    for (auto const &tx : every_kind<xchain::UnsignedTransaction>(12345)) {
        auto const encoding = xchain::encode_unsigned_transaction(tx);
        EXPECT_EQ(detect_chain(encoding), ChainTag::XChain)
            << xchain::kind_name(tx);
        EXPECT_EQ(extract_network_id(encoding), 12345)
            << xchain::kind_name(tx);
    }
}

TEST(DetectChain, EveryCChainKind)
{
    std::vector<cchain::UnsignedTransaction> const txs{
        sample_cchain_import_tx(1), sample_cchain_export_tx(1)};
    for (auto const &tx : txs) {
        auto const encoding = cchain::encode_unsigned_transaction(tx);
        EXPECT_EQ(detect_chain(encoding), ChainTag::CChain);
        EXPECT_EQ(extract_network_id(encoding), 1);
    }
}

TEST(DetectChain, NetworkIdOfProposalTransactions)
{
    auto const encoding =
        pchain::encode_unsigned_transaction(pchain::AdvanceTimeTx{.time = 9});
    EXPECT_EQ(detect_chain(encoding), ChainTag::PChain);
    EXPECT_EQ(extract_network_id(encoding), 0);
}

TEST(DetectChain, SignedBytesAreNotUnsigned)
{
    pchain::SignedTransaction const tx{
        .unsigned_tx = sample_create_chain_tx(5, {0}),
        .credentials = {Credential{}}};
    EXPECT_EQ(
        detect_chain(pchain::encode_signed_transaction(tx)),
        ChainTag::Undefined);
}

TEST(DetectChain, CodecCollision)
{
    auto const xtx = colliding_xchain_tx(5);
    auto const encoding = xchain::encode_unsigned_transaction(xtx);

    EXPECT_TRUE(is_xchain_tx(encoding));
    EXPECT_TRUE(is_cchain_tx(encoding));
    EXPECT_FALSE(is_pchain_tx(encoding));

    // the same bytes, built as the C-chain transaction they also are
    cchain::ImportTx ctx;
    ctx.network_id = 5;
    ctx.blockchain_id = filled_id(0x11);
    auto const source_chain_hex = "00000000"
                                  "00000000"
                                  "0000001c"
                                  "4242424242424242424242424242424242424242";
    auto const source_chain = evmc::from_hex(source_chain_hex).value();
    ASSERT_EQ(source_chain.size(), 32);
    std::memcpy(ctx.source_chain.bytes, source_chain.data(), 32);
    EXPECT_EQ(cchain::encode_unsigned_transaction(ctx), encoding);

    EXPECT_EQ(detect_chain(encoding), ChainTag::Undefined);
    EXPECT_EQ(extract_network_id(encoding), 0);
}

TEST(DetectChain, CollisionNeedsZeroCounts)
{
    // one nonzero byte in the part of the memo the C-chain codec reads as
    // vector counts breaks the collision
    auto xtx = colliding_xchain_tx(5);
    xtx.base.memo.back() = 0x01;
    auto const encoding = xchain::encode_unsigned_transaction(xtx);
    EXPECT_TRUE(is_xchain_tx(encoding));
    EXPECT_FALSE(is_cchain_tx(encoding));
    EXPECT_EQ(detect_chain(encoding), ChainTag::XChain);
    EXPECT_EQ(extract_network_id(encoding), 5);
}

TEST(DetectChain, Probes)
{
    byte_string const bytes{0x01};
    auto const accept = [](byte_string_view) { return true; };
    auto const reject = [](byte_string_view) { return false; };

    std::array<ChainProbe, 3> const single{
        ChainProbe{ChainTag::PChain, reject},
        ChainProbe{ChainTag::XChain, accept},
        ChainProbe{ChainTag::CChain, reject}};
    EXPECT_EQ(detect_chain(bytes, single), ChainTag::XChain);

    std::array<ChainProbe, 3> const none{
        ChainProbe{ChainTag::PChain, reject},
        ChainProbe{ChainTag::XChain, reject},
        ChainProbe{ChainTag::CChain, reject}};
    EXPECT_EQ(detect_chain(bytes, none), ChainTag::Undefined);

    std::array<ChainProbe, 3> const pair{
        ChainProbe{ChainTag::PChain, accept},
        ChainProbe{ChainTag::XChain, reject},
        ChainProbe{ChainTag::CChain, accept}};
    EXPECT_EQ(detect_chain(bytes, pair), ChainTag::Undefined);

    EXPECT_EQ(detect_chain(bytes, {}), ChainTag::Undefined);
}

TEST(DetectChain, EveryProbeRuns)
{
    byte_string const bytes{0x01};
    int calls = 0;
    auto const accept = [&calls](byte_string_view) {
        ++calls;
        return true;
    };
    std::array<ChainProbe, 3> const probes{
        ChainProbe{ChainTag::PChain, accept},
        ChainProbe{ChainTag::XChain, accept},
        ChainProbe{ChainTag::CChain, accept}};
    EXPECT_EQ(detect_chain(bytes, probes), ChainTag::Undefined);
    EXPECT_EQ(calls, 3);
}
