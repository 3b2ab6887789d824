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
#include <cosign/codec/decode_error.hpp>
#include <cosign/core/address.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/bytes.hpp>
#include <cosign/core/likely.h>
#include <cosign/core/result.hpp>

#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

COSIGN_CODEC_NAMESPACE_BEGIN

inline constexpr uint16_t CODEC_VERSION = 0;

// upper bound on any element count read from the wire
inline constexpr size_t MAX_SLICE_LENGTH = 256 * 1024;

template <std::unsigned_integral T>
Result<T> decode_unsigned(byte_string_view &enc)
{
    if (COSIGN_UNLIKELY(enc.size() < sizeof(T))) {
        return DecodeError::InputTooShort;
    }

    T result{};
    std::memcpy(&result, enc.data(), sizeof(T));
    enc = enc.substr(sizeof(T));
    return intx::to_big_endian(result);
}

template <size_t N>
Result<byte_string_fixed<N>> decode_byte_string_fixed(byte_string_view &enc)
{
    if (COSIGN_UNLIKELY(enc.size() < N)) {
        return DecodeError::InputTooShort;
    }

    byte_string_fixed<N> bsf;
    std::memcpy(bsf.data(), enc.data(), N);
    enc = enc.substr(N);
    return bsf;
}

inline Result<bytes32_t> decode_bytes32(byte_string_view &enc)
{
    if (COSIGN_UNLIKELY(enc.size() < sizeof(bytes32_t))) {
        return DecodeError::InputTooShort;
    }

    bytes32_t id;
    std::memcpy(id.bytes, enc.data(), sizeof(bytes32_t));
    enc = enc.substr(sizeof(bytes32_t));
    return id;
}

inline Result<Address> decode_address(byte_string_view &enc)
{
    if (COSIGN_UNLIKELY(enc.size() < sizeof(Address))) {
        return DecodeError::InputTooShort;
    }

    Address address;
    std::memcpy(address.bytes, enc.data(), sizeof(Address));
    enc = enc.substr(sizeof(Address));
    return address;
}

/// u32 length followed by that many bytes
inline Result<byte_string> decode_bytes(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const length, decode_unsigned<uint32_t>(enc));
    if (COSIGN_UNLIKELY(length > enc.size())) {
        return DecodeError::InputTooShort;
    }
    byte_string result{enc.substr(0, length)};
    enc = enc.substr(length);
    return result;
}

/// u16 length followed by that many bytes
inline Result<std::string> decode_string(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const length, decode_unsigned<uint16_t>(enc));
    if (COSIGN_UNLIKELY(length > enc.size())) {
        return DecodeError::InputTooShort;
    }
    std::string result{reinterpret_cast<char const *>(enc.data()), length};
    enc = enc.substr(length);
    return result;
}

/// Element count of a vector. Every element occupies at least
/// min_element_size bytes, so a count the remaining input cannot hold is
/// rejected before anything is allocated.
inline Result<size_t>
decode_length(byte_string_view &enc, size_t const min_element_size)
{
    BOOST_OUTCOME_TRY(auto const count, decode_unsigned<uint32_t>(enc));
    if (COSIGN_UNLIKELY(count > MAX_SLICE_LENGTH)) {
        return DecodeError::LengthOverflow;
    }
    if (COSIGN_UNLIKELY(
            min_element_size != 0 && count > enc.size() / min_element_size)) {
        return DecodeError::InputTooShort;
    }
    return static_cast<size_t>(count);
}

template <typename T, typename F>
Result<std::vector<T>> decode_list(
    byte_string_view &enc, size_t const min_element_size, F &&decode_element)
{
    BOOST_OUTCOME_TRY(
        auto const count, decode_length(enc, min_element_size));
    std::vector<T> list;
    list.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        BOOST_OUTCOME_TRY(auto element, decode_element(enc));
        list.push_back(std::move(element));
    }
    return list;
}

inline Result<void>
decode_type_id(byte_string_view &enc, uint32_t const expected)
{
    BOOST_OUTCOME_TRY(auto const type_id, decode_unsigned<uint32_t>(enc));
    if (COSIGN_UNLIKELY(type_id != expected)) {
        return DecodeError::UnknownTypeId;
    }
    return outcome::success();
}

inline Result<void> decode_codec_version(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const version, decode_unsigned<uint16_t>(enc));
    if (COSIGN_UNLIKELY(version != CODEC_VERSION)) {
        return DecodeError::UnknownCodecVersion;
    }
    return outcome::success();
}

inline Result<void> decode_end(byte_string_view const enc)
{
    if (COSIGN_UNLIKELY(!enc.empty())) {
        return DecodeError::InputTooLong;
    }
    return outcome::success();
}

COSIGN_CODEC_NAMESPACE_END
