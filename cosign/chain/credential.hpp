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

#include <cosign/core/config.hpp>

#include <cosign/core/byte_string.hpp>

#include <algorithm>
#include <cstddef>
#include <vector>

COSIGN_NAMESPACE_BEGIN

inline constexpr size_t SIGNATURE_SIZE = 65;

/// Recoverable secp256k1 signature; all zeroes marks a slot nobody has
/// signed yet
using Signature = byte_string_fixed<SIGNATURE_SIZE>;

inline constexpr Signature EMPTY_SIGNATURE{};

constexpr bool is_empty(Signature const &sig)
{
    return sig == EMPTY_SIGNATURE;
}

struct Credential
{
    std::vector<Signature> signatures{};

    friend bool operator==(Credential const &, Credential const &) = default;
};

inline bool is_fully_signed(Credential const &cred)
{
    return std::none_of(
        cred.signatures.begin(),
        cred.signatures.end(),
        [](Signature const &sig) { return is_empty(sig); });
}

COSIGN_NAMESPACE_END
