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
#include <cosign/chain/cchain/transaction_info.hpp>
#include <cosign/chain/test/sample_transactions.hpp>
#include <cosign/codec/decode_error.hpp>
#include <cosign/core/byte_string.hpp>

#include <evmc/hex.hpp>

#include <gtest/gtest.h>

using namespace cosign;
using namespace cosign::codec;
using namespace cosign::cchain;
using namespace cosign::test;

TEST(CChainCodec, Import)
{
    UnsignedTransaction const tx = sample_cchain_import_tx(5);
    auto const decoded =
        decode_unsigned_transaction(encode_unsigned_transaction(tx));
    ASSERT_FALSE(decoded.has_error());
    EXPECT_EQ(decoded.value(), tx);
    EXPECT_EQ(kind_name(decoded.value()), "ImportTx");
    EXPECT_EQ(network_id(decoded.value()), 5);
    EXPECT_EQ(blockchain_id(decoded.value()), filled_id(0x33));
    EXPECT_EQ(hrp(decoded.value()), "fuji");
}

TEST(CChainCodec, Export)
{
    UnsignedTransaction const tx = sample_cchain_export_tx(1);
    auto const decoded =
        decode_unsigned_transaction(encode_unsigned_transaction(tx));
    ASSERT_FALSE(decoded.has_error());
    EXPECT_EQ(decoded.value(), tx);
    EXPECT_EQ(kind_name(decoded.value()), "ExportTx");
    EXPECT_EQ(network_id(decoded.value()), 1);
}

TEST(CChainCodec, EvmInputLayout)
{
    EvmInput const input{
        .address = filled_address(0x02),
        .amount = 1,
        .asset_id = filled_id(0x00),
        .nonce = 2};
    auto const encoding = encode_evm_input(input);
    EXPECT_EQ(encoding.size(), 20 + 8 + 32 + 8);
    EXPECT_EQ(
        evmc::hex(encoding).substr(40, 16), "0000000000000001");
}

TEST(CChainCodec, TypeIdTwoRejected)
{
    byte_string const encoding = evmc::from_hex("0000" "00000002").value();
    EXPECT_EQ(
        decode_unsigned_transaction(encoding).error(),
        DecodeError::UnknownTypeId);
}
