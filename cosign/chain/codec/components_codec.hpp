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

#include <cosign/chain/components.hpp>
#include <cosign/chain/credential.hpp>
#include <cosign/codec/config.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/result.hpp>

#include <cstddef>

COSIGN_CODEC_NAMESPACE_BEGIN

// smallest wire sizes, used to bound vector counts before allocating
inline constexpr size_t OUTPUT_OWNERS_MIN_SIZE = 8 + 4 + 4;
inline constexpr size_t TRANSFERABLE_OUTPUT_MIN_SIZE =
    32 + 4 + 8 + OUTPUT_OWNERS_MIN_SIZE;
inline constexpr size_t TRANSFERABLE_INPUT_MIN_SIZE = 32 + 4 + 32 + 4 + 8 + 4;
inline constexpr size_t CREDENTIAL_MIN_SIZE = 4 + 4;

byte_string encode_output_owners(OutputOwners const &);
byte_string encode_owner(OutputOwners const &);
byte_string encode_transfer_output(TransferOutput const &);
byte_string encode_mint_output(MintOutput const &);
byte_string encode_transfer_input(TransferInput const &);
byte_string encode_utxo_id(UtxoId const &);
byte_string encode_transferable_output(TransferableOutput const &);
byte_string encode_transferable_input(TransferableInput const &);
byte_string encode_base_tx(BaseTx const &);
byte_string encode_subnet_auth(SubnetAuth const &);
byte_string encode_validator(Validator const &);
byte_string encode_proof_of_possession(ProofOfPossession const &);
byte_string encode_credential(Credential const &);

Result<OutputOwners> decode_output_owners(byte_string_view &);
Result<OutputOwners> decode_owner(byte_string_view &);
Result<TransferOutput> decode_transfer_output(byte_string_view &);
Result<MintOutput> decode_mint_output(byte_string_view &);
Result<TransferInput> decode_transfer_input(byte_string_view &);
Result<UtxoId> decode_utxo_id(byte_string_view &);
Result<TransferableOutput> decode_transferable_output(byte_string_view &);
Result<TransferableInput> decode_transferable_input(byte_string_view &);
Result<BaseTx> decode_base_tx(byte_string_view &);
Result<SubnetAuth> decode_subnet_auth(byte_string_view &);
Result<Validator> decode_validator(byte_string_view &);
Result<ProofOfPossession> decode_proof_of_possession(byte_string_view &);
Result<Credential> decode_credential(byte_string_view &);

COSIGN_CODEC_NAMESPACE_END
