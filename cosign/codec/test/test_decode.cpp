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

#include <cosign/codec/decode.hpp>
#include <cosign/codec/decode_error.hpp>
#include <cosign/codec/encode.hpp>
#include <cosign/core/byte_string.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace cosign;
using namespace cosign::codec;
using namespace evmc::literals;

TEST(Codec, DecodeUnsignedBigEndian)
{
    byte_string const encoding{
        0x12, 0x34, 0x00, 0x00, 0x00, 0x2a, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x30, 0x39, 0x07};
    byte_string_view enc{encoding};

    auto const u16 = decode_unsigned<uint16_t>(enc);
    ASSERT_FALSE(u16.has_error());
    EXPECT_EQ(u16.value(), 0x1234);

    auto const u32 = decode_unsigned<uint32_t>(enc);
    ASSERT_FALSE(u32.has_error());
    EXPECT_EQ(u32.value(), 42);

    auto const u64 = decode_unsigned<uint64_t>(enc);
    ASSERT_FALSE(u64.has_error());
    EXPECT_EQ(u64.value(), 12345);

    auto const u8 = decode_unsigned<uint8_t>(enc);
    ASSERT_FALSE(u8.has_error());
    EXPECT_EQ(u8.value(), 7);

    EXPECT_TRUE(enc.empty());
    EXPECT_EQ(
        decode_unsigned<uint32_t>(enc).error(),
        DecodeError::InputTooShort);
}

TEST(Codec, DecodeTruncated)
{
    byte_string const encoding{0x00, 0x00, 0x00};
    byte_string_view enc{encoding};
    EXPECT_EQ(
        decode_unsigned<uint32_t>(enc).error(),
        DecodeError::InputTooShort);

    byte_string_view id_enc{encoding};
    EXPECT_EQ(
        decode_bytes32(id_enc).error(), DecodeError::InputTooShort);

    byte_string_view address_enc{encoding};
    EXPECT_EQ(
        decode_address(address_enc).error(),
        DecodeError::InputTooShort);
}

TEST(Codec, DecodeBytesLengthPastEnd)
{
    // claims 5 bytes, carries 2
    byte_string const encoding{0x00, 0x00, 0x00, 0x05, 0xaa, 0xbb};
    byte_string_view enc{encoding};
    EXPECT_EQ(decode_bytes(enc).error(), DecodeError::InputTooShort);
}

TEST(Codec, DecodeString)
{
    byte_string const encoding{0x00, 0x03, 'a', 'b', 'c', 0xff};
    byte_string_view enc{encoding};
    auto const str = decode_string(enc);
    ASSERT_FALSE(str.has_error());
    EXPECT_EQ(str.value(), "abc");
    EXPECT_EQ(enc.size(), 1);
}

TEST(Codec, DecodeLengthCannotFitRemaining)
{
    // 3 elements of at least 4 bytes each need 12 bytes
    byte_string const encoding{
        0x00, 0x00, 0x00, 0x03, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x02};
    byte_string_view enc{encoding};
    EXPECT_EQ(
        decode_length(enc, sizeof(uint32_t)).error(),
        DecodeError::InputTooShort);

    byte_string_view enc2{encoding};
    auto const count = decode_length(enc2, 1);
    ASSERT_FALSE(count.has_error());
    EXPECT_EQ(count.value(), 3);
}

TEST(Codec, DecodeLengthOverflow)
{
    byte_string const encoding{0xff, 0xff, 0xff, 0xff};
    byte_string_view enc{encoding};
    EXPECT_EQ(decode_length(enc, 0).error(), DecodeError::LengthOverflow);
}

TEST(Codec, DecodeList)
{
    byte_string const encoding{
        0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x07, 0x00, 0x00, 0x00, 0x09};
    byte_string_view enc{encoding};
    auto const list = decode_list<uint32_t>(
        enc, sizeof(uint32_t), decode_unsigned<uint32_t>);
    ASSERT_FALSE(list.has_error());
    EXPECT_EQ(list.value(), (std::vector<uint32_t>{7, 9}));
    EXPECT_TRUE(decode_end(enc).has_value());
}

TEST(Codec, DecodeTypeId)
{
    byte_string const encoding{0x00, 0x00, 0x00, 0x0b, 0x00, 0x00, 0x00, 0x0a};
    byte_string_view enc{encoding};
    EXPECT_FALSE(decode_type_id(enc, 11).has_error());
    EXPECT_EQ(decode_type_id(enc, 11).error(), DecodeError::UnknownTypeId);
}

TEST(Codec, DecodeCodecVersion)
{
    byte_string const good{0x00, 0x00};
    byte_string_view enc{good};
    EXPECT_FALSE(decode_codec_version(enc).has_error());

    byte_string const bad{0x00, 0x01};
    byte_string_view bad_enc{bad};
    EXPECT_EQ(
        decode_codec_version(bad_enc).error(),
        DecodeError::UnknownCodecVersion);
}

TEST(Codec, DecodeEndRejectsTrailingBytes)
{
    byte_string const encoding{0x00};
    EXPECT_EQ(decode_end(encoding).error(), DecodeError::InputTooLong);
}

TEST(Codec, DecodeFixedIds)
{
    auto const id =
        0x0102030405060708091011121314151617181920212223242526272829303132_bytes32;
    auto const address = 0x00000000000000000000000000000000000000ff_address;

    byte_string encoding = encode_bytes32(id);
    encoding += encode_address(address);
    byte_string_view enc{encoding};

    auto const decoded_id = decode_bytes32(enc);
    ASSERT_FALSE(decoded_id.has_error());
    EXPECT_EQ(decoded_id.value(), id);

    auto const decoded_address = decode_address(enc);
    ASSERT_FALSE(decoded_address.has_error());
    EXPECT_EQ(decoded_address.value(), address);
    EXPECT_TRUE(enc.empty());
}
