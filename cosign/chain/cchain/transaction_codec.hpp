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

#include <cosign/chain/cchain/transaction.hpp>
#include <cosign/chain/config.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/result.hpp>

COSIGN_CCHAIN_NAMESPACE_BEGIN

byte_string encode_evm_output(EvmOutput const &);
byte_string encode_evm_input(EvmInput const &);
byte_string encode_transaction_body(UnsignedTransaction const &);
byte_string encode_unsigned_transaction(UnsignedTransaction const &);

Result<EvmOutput> decode_evm_output(byte_string_view &);
Result<EvmInput> decode_evm_input(byte_string_view &);
Result<UnsignedTransaction> decode_transaction_body(byte_string_view &);

// whole blob: codec version, transaction, nothing after
Result<UnsignedTransaction> decode_unsigned_transaction(byte_string_view);

COSIGN_CCHAIN_NAMESPACE_END
