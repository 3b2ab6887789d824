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

#include <cosign/chain/codec/components_codec.hpp>
#include <cosign/chain/components.hpp>
#include <cosign/chain/credential.hpp>
#include <cosign/chain/test/sample_transactions.hpp>
#include <cosign/codec/decode_error.hpp>
#include <cosign/core/byte_string.hpp>

#include <evmc/hex.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace cosign;
using namespace cosign::codec;
using namespace cosign::test;

TEST(ComponentsCodec, EncodeOwner)
{
    OutputOwners const owners{
        .locktime = 0, .threshold = 1, .addresses = {filled_address(0x01)}};

    EXPECT_EQ(
        evmc::hex(encode_owner(owners)),
        "0000000b"
        "0000000000000000"
        "00000001"
        "00000001"
        "0101010101010101010101010101010101010101");
}

TEST(ComponentsCodec, EncodeSubnetAuth)
{
    SubnetAuth const auth{.signature_indices = {0, 2}};
    EXPECT_EQ(
        evmc::hex(encode_subnet_auth(auth)),
        "0000000a"
        "00000002"
        "00000000"
        "00000002");
}

TEST(ComponentsCodec, DecodeBaseTx)
{
    auto const base = sample_base_tx(5);
    auto const encoding = encode_base_tx(base);

    byte_string_view enc{encoding};
    auto const decoded = decode_base_tx(enc);
    ASSERT_FALSE(decoded.has_error());
    EXPECT_TRUE(enc.empty());
    EXPECT_EQ(decoded.value(), base);
    EXPECT_EQ(decoded.value().network_id, 5);
    ASSERT_EQ(decoded.value().inputs.size(), 1);
    EXPECT_EQ(
        decoded.value().inputs[0].input.signature_indices,
        std::vector<uint32_t>{0});
}

TEST(ComponentsCodec, DecodeBaseTxTruncated)
{
    auto const encoding = encode_base_tx(sample_base_tx(5));
    for (size_t size : {0ul, 4ul, 36ul, 40ul, encoding.size() - 1}) {
        byte_string_view enc{encoding.data(), size};
        EXPECT_EQ(decode_base_tx(enc).error(), DecodeError::InputTooShort)
            << "size " << size;
    }
}

TEST(ComponentsCodec, DecodeOwnerWrongTypeId)
{
    // a transfer output where an owner is expected
    byte_string const encoding =
        evmc::from_hex("00000007000000000000000000000001"
                       "00000000")
            .value();
    byte_string_view enc{encoding};
    EXPECT_EQ(decode_owner(enc).error(), DecodeError::UnknownTypeId);
}

TEST(ComponentsCodec, DecodeCredential)
{
    Credential cred;
    cred.signatures.resize(2);
    cred.signatures[1].fill(0x7f);

    auto const encoding = encode_credential(cred);
    EXPECT_EQ(encoding.size(), 4 + 4 + 2 * SIGNATURE_SIZE);

    byte_string_view enc{encoding};
    auto const decoded = decode_credential(enc);
    ASSERT_FALSE(decoded.has_error());
    EXPECT_EQ(decoded.value(), cred);
    EXPECT_TRUE(is_empty(decoded.value().signatures[0]));
    EXPECT_FALSE(is_empty(decoded.value().signatures[1]));
    EXPECT_FALSE(is_fully_signed(decoded.value()));
}

TEST(ComponentsCodec, CredentialCountPastEnd)
{
    // claims three signatures, carries one
    Credential cred;
    cred.signatures.resize(1);
    auto encoding = encode_credential(cred);
    encoding[7] = 3;

    byte_string_view enc{encoding};
    EXPECT_EQ(decode_credential(enc).error(), DecodeError::InputTooShort);
}
