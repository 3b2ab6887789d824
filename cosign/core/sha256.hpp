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
#include <cosign/core/bytes.hpp>

#include <silkpre/sha256.h>

COSIGN_NAMESPACE_BEGIN

inline bytes32_t sha256(byte_string_view const bytes)
{
    bytes32_t h;
    silkpre_sha256(
        h.bytes, bytes.data(), bytes.size(), true /* use_cpu_extensions */);
    return h;
}

COSIGN_NAMESPACE_END
