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

#include <cosign/chain/pchain/signed_transaction.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/result.hpp>

#include <filesystem>

COSIGN_NAMESPACE_BEGIN

/// Canonical signed encoding; partially signed transactions keep their empty
/// slots
byte_string to_bytes(pchain::SignedTransaction const &);

Result<pchain::SignedTransaction> from_bytes(byte_string_view);

/// Lowercase hex of to_bytes as a single line of text
Result<void>
to_file(pchain::SignedTransaction const &, std::filesystem::path const &);

/// Accepts surrounding whitespace and a 0x prefix
Result<pchain::SignedTransaction> from_file(std::filesystem::path const &);

COSIGN_NAMESPACE_END
