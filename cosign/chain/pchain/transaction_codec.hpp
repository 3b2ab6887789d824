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

#include <cosign/chain/config.hpp>
#include <cosign/chain/pchain/signed_transaction.hpp>
#include <cosign/chain/pchain/transaction.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/result.hpp>

COSIGN_PCHAIN_NAMESPACE_BEGIN

byte_string encode_staking_signer(StakingSigner const &);
byte_string encode_l1_validator(L1Validator const &);

/// type id and fields, without the codec version
byte_string encode_transaction_body(UnsignedTransaction const &);
byte_string encode_unsigned_transaction(UnsignedTransaction const &);
byte_string encode_signed_transaction(SignedTransaction const &);

Result<StakingSigner> decode_staking_signer(byte_string_view &);
Result<L1Validator> decode_l1_validator(byte_string_view &);

Result<UnsignedTransaction> decode_transaction_body(byte_string_view &);

// whole blob: codec version, transaction, nothing after
Result<UnsignedTransaction> decode_unsigned_transaction(byte_string_view);
Result<SignedTransaction> decode_signed_transaction(byte_string_view);

COSIGN_PCHAIN_NAMESPACE_END
