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

#include <cosign/core/address.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/bytes.hpp>
#include <cosign/core/fmt/address_fmt.hpp> // NOLINT
#include <cosign/core/fmt/bytes_fmt.hpp> // NOLINT
#include <cosign/core/sha256.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <gtest/gtest.h>

#include <quill/bundled/fmt/format.h>

#include <string>

using namespace cosign;
using namespace evmc::literals;

TEST(Sha256, EmptyInput)
{
    EXPECT_EQ(
        sha256({}),
        0xe3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855_bytes32);
}

TEST(Sha256, ShortInput)
{
    std::string const abc{"abc"};
    EXPECT_EQ(
        sha256(to_byte_string_view(abc)),
        0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad_bytes32);
}

TEST(Formatter, HexWithPrefix)
{
    EXPECT_EQ(
        fmt::format("{}", 0x00000000000000000000000000000000000000ff_address),
        "0x00000000000000000000000000000000000000ff");
    EXPECT_EQ(
        fmt::format("{}", bytes32_t{}),
        "0x0000000000000000000000000000000000000000000000000000000000000000");
}
