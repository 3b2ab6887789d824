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

#include <cosign/chain/credential.hpp>
#include <cosign/chain/pchain/signed_transaction.hpp>
#include <cosign/chain/pchain/transaction.hpp>
#include <cosign/chain/pchain/transaction_codec.hpp>
#include <cosign/chain/pchain/transaction_info.hpp>
#include <cosign/chain/test/sample_transactions.hpp>
#include <cosign/codec/decode_error.hpp>
#include <cosign/core/byte_string.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <gtest/gtest.h>

#include <variant>

using namespace cosign;
using namespace cosign::codec;
using namespace cosign::pchain;
using namespace cosign::test;
using namespace evmc::literals;

TEST(PChainCodec, EveryKindDecodes)
{
    for (auto const &tx : every_kind<UnsignedTransaction>(5)) {
        auto const encoding = encode_unsigned_transaction(tx);
        auto const decoded = decode_unsigned_transaction(encoding);
        ASSERT_FALSE(decoded.has_error()) << kind_name(tx);
        EXPECT_EQ(decoded.value(), tx) << kind_name(tx);
    }
}

TEST(PChainCodec, Layout)
{
    AdvanceTimeTx const tx{.time = 0x0102030405060708};
    EXPECT_EQ(
        evmc::hex(encode_unsigned_transaction(tx)),
        "0000"
        "00000013"
        "0102030405060708");

    RewardValidatorTx const reward{.tx_id = filled_id(0x01)};
    EXPECT_EQ(encode_unsigned_transaction(reward).size(), 2 + 4 + 32);
}

TEST(PChainCodec, UnknownTypeId)
{
    byte_string const encoding =
        evmc::from_hex("0000" "00000000" "0000000000000001").value();
    EXPECT_EQ(
        decode_unsigned_transaction(encoding).error(),
        DecodeError::UnknownTypeId);
}

TEST(PChainCodec, UnknownCodecVersion)
{
    auto encoding = encode_unsigned_transaction(AdvanceTimeTx{.time = 1});
    encoding[1] = 0x01;
    EXPECT_EQ(
        decode_unsigned_transaction(encoding).error(),
        DecodeError::UnknownCodecVersion);
}

TEST(PChainCodec, TrailingBytes)
{
    auto encoding =
        encode_unsigned_transaction(sample_create_chain_tx(5, {0, 1}));
    encoding.push_back(0x00);
    EXPECT_EQ(
        decode_unsigned_transaction(encoding).error(),
        DecodeError::InputTooLong);
}

TEST(PChainCodec, Truncated)
{
    auto const encoding =
        encode_unsigned_transaction(sample_create_chain_tx(5, {0, 1}));
    for (size_t size = 0; size < encoding.size(); ++size) {
        EXPECT_TRUE(
            decode_unsigned_transaction({encoding.data(), size}).has_error())
            << "size " << size;
    }
}

TEST(PChainCodec, EmptyBytes)
{
    EXPECT_EQ(
        decode_unsigned_transaction({}).error(), DecodeError::InputTooShort);
}

TEST(PChainCodec, StakingSigner)
{
    auto tx = sample_of<AddPermissionlessValidatorTx>(1);
    ProofOfPossession pop;
    pop.public_key.fill(0x0a);
    pop.signature.fill(0x0b);
    tx.signer = pop;

    auto const decoded =
        decode_unsigned_transaction(encode_unsigned_transaction(tx));
    ASSERT_FALSE(decoded.has_error());
    auto const &decoded_tx =
        std::get<AddPermissionlessValidatorTx>(decoded.value());
    ASSERT_TRUE(std::holds_alternative<ProofOfPossession>(decoded_tx.signer));
    EXPECT_EQ(std::get<ProofOfPossession>(decoded_tx.signer), pop);

    byte_string const bad_signer = evmc::from_hex("0000001d").value();
    byte_string_view enc{bad_signer};
    EXPECT_EQ(decode_staking_signer(enc).error(), DecodeError::UnknownTypeId);
}

TEST(PChainCodec, ConvertSubnetToL1Validators)
{
    auto tx = sample_of<ConvertSubnetToL1Tx>(5);
    tx.chain_id = filled_id(0x0c);
    tx.manager_address = byte_string(20, 0xee);
    L1Validator validator;
    validator.node_id = byte_string(20, 0x4e);
    validator.weight = 100;
    validator.balance = 5;
    validator.remaining_balance_owner = {
        .threshold = 1, .addresses = {filled_address(0x03)}};
    tx.validators.push_back(validator);

    auto const decoded =
        decode_unsigned_transaction(encode_unsigned_transaction(tx));
    ASSERT_FALSE(decoded.has_error());
    EXPECT_EQ(decoded.value(), UnsignedTransaction{tx});
}

TEST(PChainSignedTransaction, Decode)
{
    SignedTransaction tx{
        .unsigned_tx = sample_create_chain_tx(5, {0, 2}),
        .credentials = {Credential{}, Credential{}}};
    tx.credentials[0].signatures.resize(1);
    tx.credentials[0].signatures[0].fill(0x01);
    tx.credentials[1].signatures.resize(2);
    tx.credentials[1].signatures[1].fill(0x02);

    auto const encoding = encode_signed_transaction(tx);
    auto const unsigned_encoding = encode_unsigned_transaction(tx.unsigned_tx);
    EXPECT_EQ(
        byte_string_view(encoding).substr(0, unsigned_encoding.size()),
        byte_string_view(unsigned_encoding));

    auto const decoded = decode_signed_transaction(encoding);
    ASSERT_FALSE(decoded.has_error());
    EXPECT_EQ(decoded.value(), tx);
    EXPECT_TRUE(is_empty(decoded.value().credentials[1].signatures[0]));
    EXPECT_FALSE(is_empty(decoded.value().credentials[1].signatures[1]));
}

TEST(PChainSignedTransaction, TxIdTracksSignatures)
{
    SignedTransaction tx{
        .unsigned_tx = sample_create_chain_tx(5, {0}),
        .credentials = {Credential{}, Credential{}}};
    tx.credentials[0].signatures.resize(1);
    tx.credentials[1].signatures.resize(1);

    auto const id = tx_id(tx);
    EXPECT_EQ(tx_id(tx), id);

    tx.credentials[1].signatures[0].fill(0x09);
    EXPECT_NE(tx_id(tx), id);
}

TEST(PChainSignedTransaction, TxIdIsSha256OfSignedBytes)
{
    SignedTransaction tx{
        .unsigned_tx = AdvanceTimeTx{.time = 0x0102030405060708},
        .credentials = {Credential{}}};
    tx.credentials[0].signatures.resize(1);
    tx.credentials[0].signatures[0].fill(0x01);

    EXPECT_EQ(
        evmc::hex(encode_signed_transaction(tx)),
        "0000"
        "00000013"
        "0102030405060708"
        "00000001"
        "00000009"
        "00000001"
        "0101010101010101010101010101010101010101010101010101010101010101"
        "0101010101010101010101010101010101010101010101010101010101010101"
        "01");
    EXPECT_EQ(
        tx_id(tx),
        0x18df48ead7c82a5b0304101977d12f885763abb17ed7a681d5512076a2ca7657_bytes32);
}
