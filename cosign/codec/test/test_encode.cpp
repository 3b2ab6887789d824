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

#include <cosign/codec/encode.hpp>
#include <cosign/core/byte_string.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace cosign;
using namespace cosign::codec;

TEST(Codec, EncodeUnsigned)
{
    EXPECT_EQ(encode_unsigned(uint16_t{0x1234}), (byte_string{0x12, 0x34}));
    EXPECT_EQ(
        encode_unsigned(uint32_t{12345}), (byte_string{0x00, 0x00, 0x30, 0x39}));
    EXPECT_EQ(
        encode_unsigned(uint64_t{1}),
        (byte_string{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01}));
    EXPECT_EQ(encode_unsigned(uint8_t{0xfe}), (byte_string{0xfe}));
}

TEST(Codec, EncodeCodecVersion)
{
    EXPECT_EQ(encode_codec_version(), (byte_string{0x00, 0x00}));
}

TEST(Codec, EncodeBytes)
{
    byte_string const payload{0xde, 0xad};
    EXPECT_EQ(
        encode_bytes(payload),
        (byte_string{0x00, 0x00, 0x00, 0x02, 0xde, 0xad}));
    EXPECT_EQ(encode_bytes({}), (byte_string{0x00, 0x00, 0x00, 0x00}));
}

TEST(Codec, EncodeString)
{
    EXPECT_EQ(
        encode_string("hi"), (byte_string{0x00, 0x02, 'h', 'i'}));
}

TEST(Codec, EncodeList)
{
    std::vector<uint32_t> const indices{0, 2};
    EXPECT_EQ(
        encode_list(indices, encode_unsigned<uint32_t>),
        (byte_string{
            0x00,
            0x00,
            0x00,
            0x02,
            0x00,
            0x00,
            0x00,
            0x00,
            0x00,
            0x00,
            0x00,
            0x02}));
}
