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
#include <cosign/core/result.hpp>

COSIGN_NAMESPACE_BEGIN

/// Combine the signatures of two independently advanced copies of one
/// transaction into `into`. A slot filled in either copy is filled in the
/// result. Fails with MergeError, leaving `into` untouched, when the copies
/// differ in their unsigned bytes or credential shape, or when both fill a
/// slot with different signatures.
Result<void> merge_signatures(
    pchain::SignedTransaction &into, pchain::SignedTransaction const &from);

COSIGN_NAMESPACE_END
