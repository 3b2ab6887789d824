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

#include <cosign/codec/config.hpp>
#include <cosign/codec/decode.hpp>
#include <cosign/core/address.hpp>
#include <cosign/core/assert.h>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/bytes.hpp>

#include <intx/intx.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <vector>

COSIGN_CODEC_NAMESPACE_BEGIN

template <std::unsigned_integral T>
byte_string encode_unsigned(T n)
{
    n = intx::to_big_endian(n);
    return byte_string(reinterpret_cast<unsigned char const *>(&n), sizeof(n));
}

template <size_t N>
byte_string encode_byte_string_fixed(byte_string_fixed<N> const &bsf)
{
    return byte_string(bsf.data(), N);
}

inline byte_string encode_bytes32(bytes32_t const &id)
{
    return byte_string(id.bytes, sizeof(id.bytes));
}

inline byte_string encode_address(Address const &address)
{
    return byte_string(address.bytes, sizeof(address.bytes));
}

inline byte_string encode_bytes(byte_string_view const bytes)
{
    COSIGN_ASSERT(bytes.size() <= std::numeric_limits<uint32_t>::max());
    byte_string result = encode_unsigned(static_cast<uint32_t>(bytes.size()));
    result += bytes;
    return result;
}

inline byte_string encode_string(std::string_view const str)
{
    COSIGN_ASSERT(str.size() <= std::numeric_limits<uint16_t>::max());
    byte_string result = encode_unsigned(static_cast<uint16_t>(str.size()));
    result.append(
        reinterpret_cast<unsigned char const *>(str.data()), str.size());
    return result;
}

inline byte_string encode_type_id(uint32_t const type_id)
{
    return encode_unsigned(type_id);
}

inline byte_string encode_codec_version()
{
    return encode_unsigned(CODEC_VERSION);
}

template <typename T, typename F>
byte_string encode_list(std::vector<T> const &list, F &&encode_element)
{
    COSIGN_ASSERT(list.size() <= MAX_SLICE_LENGTH);
    byte_string result = encode_unsigned(static_cast<uint32_t>(list.size()));
    for (auto const &element : list) {
        result += encode_element(element);
    }
    return result;
}

COSIGN_CODEC_NAMESPACE_END
