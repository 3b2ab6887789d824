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

#include <cosign/chain/codec/components_codec.hpp>
#include <cosign/chain/components.hpp>
#include <cosign/chain/credential.hpp>
#include <cosign/codec/config.hpp>
#include <cosign/codec/decode.hpp>
#include <cosign/codec/encode.hpp>
#include <cosign/core/address.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/result.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>

COSIGN_CODEC_NAMESPACE_BEGIN

// Encode

byte_string encode_output_owners(OutputOwners const &owners)
{
    byte_string encoding{};
    encoding += encode_unsigned(owners.locktime);
    encoding += encode_unsigned(owners.threshold);
    encoding += encode_list(owners.addresses, encode_address);
    return encoding;
}

byte_string encode_owner(OutputOwners const &owners)
{
    return encode_type_id(OUTPUT_OWNERS_TYPE_ID) + encode_output_owners(owners);
}

byte_string encode_transfer_output(TransferOutput const &output)
{
    byte_string encoding = encode_type_id(TRANSFER_OUTPUT_TYPE_ID);
    encoding += encode_unsigned(output.amount);
    encoding += encode_output_owners(output.owners);
    return encoding;
}

byte_string encode_mint_output(MintOutput const &output)
{
    return encode_type_id(MINT_OUTPUT_TYPE_ID) +
           encode_output_owners(output.owners);
}

byte_string encode_transfer_input(TransferInput const &input)
{
    byte_string encoding = encode_type_id(TRANSFER_INPUT_TYPE_ID);
    encoding += encode_unsigned(input.amount);
    encoding += encode_list(input.signature_indices, encode_unsigned<uint32_t>);
    return encoding;
}

byte_string encode_utxo_id(UtxoId const &utxo_id)
{
    return encode_bytes32(utxo_id.tx_id) +
           encode_unsigned(utxo_id.output_index);
}

byte_string encode_transferable_output(TransferableOutput const &output)
{
    return encode_bytes32(output.asset_id) +
           encode_transfer_output(output.output);
}

byte_string encode_transferable_input(TransferableInput const &input)
{
    byte_string encoding = encode_utxo_id(input.utxo_id);
    encoding += encode_bytes32(input.asset_id);
    encoding += encode_transfer_input(input.input);
    return encoding;
}

byte_string encode_base_tx(BaseTx const &base)
{
    byte_string encoding{};
    encoding += encode_unsigned(base.network_id);
    encoding += encode_bytes32(base.blockchain_id);
    encoding += encode_list(base.outputs, encode_transferable_output);
    encoding += encode_list(base.inputs, encode_transferable_input);
    encoding += encode_bytes(base.memo);
    return encoding;
}

byte_string encode_subnet_auth(SubnetAuth const &auth)
{
    return encode_type_id(INPUT_TYPE_ID) +
           encode_list(auth.signature_indices, encode_unsigned<uint32_t>);
}

byte_string encode_validator(Validator const &validator)
{
    byte_string encoding = encode_address(validator.node_id);
    encoding += encode_unsigned(validator.start_time);
    encoding += encode_unsigned(validator.end_time);
    encoding += encode_unsigned(validator.weight);
    return encoding;
}

byte_string encode_proof_of_possession(ProofOfPossession const &pop)
{
    return encode_byte_string_fixed(pop.public_key) +
           encode_byte_string_fixed(pop.signature);
}

byte_string encode_credential(Credential const &cred)
{
    return encode_type_id(CREDENTIAL_TYPE_ID) +
           encode_list(
               cred.signatures, encode_byte_string_fixed<SIGNATURE_SIZE>);
}

// Decode

Result<OutputOwners> decode_output_owners(byte_string_view &enc)
{
    OutputOwners owners;
    BOOST_OUTCOME_TRY(owners.locktime, decode_unsigned<uint64_t>(enc));
    BOOST_OUTCOME_TRY(owners.threshold, decode_unsigned<uint32_t>(enc));
    BOOST_OUTCOME_TRY(
        owners.addresses,
        decode_list<Address>(enc, sizeof(Address), decode_address));
    return owners;
}

Result<OutputOwners> decode_owner(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(decode_type_id(enc, OUTPUT_OWNERS_TYPE_ID));
    return decode_output_owners(enc);
}

Result<TransferOutput> decode_transfer_output(byte_string_view &enc)
{
    TransferOutput output;
    BOOST_OUTCOME_TRY(decode_type_id(enc, TRANSFER_OUTPUT_TYPE_ID));
    BOOST_OUTCOME_TRY(output.amount, decode_unsigned<uint64_t>(enc));
    BOOST_OUTCOME_TRY(output.owners, decode_output_owners(enc));
    return output;
}

Result<MintOutput> decode_mint_output(byte_string_view &enc)
{
    MintOutput output;
    BOOST_OUTCOME_TRY(decode_type_id(enc, MINT_OUTPUT_TYPE_ID));
    BOOST_OUTCOME_TRY(output.owners, decode_output_owners(enc));
    return output;
}

Result<TransferInput> decode_transfer_input(byte_string_view &enc)
{
    TransferInput input;
    BOOST_OUTCOME_TRY(decode_type_id(enc, TRANSFER_INPUT_TYPE_ID));
    BOOST_OUTCOME_TRY(input.amount, decode_unsigned<uint64_t>(enc));
    BOOST_OUTCOME_TRY(
        input.signature_indices,
        decode_list<uint32_t>(
            enc, sizeof(uint32_t), decode_unsigned<uint32_t>));
    return input;
}

Result<UtxoId> decode_utxo_id(byte_string_view &enc)
{
    UtxoId utxo_id;
    BOOST_OUTCOME_TRY(utxo_id.tx_id, decode_bytes32(enc));
    BOOST_OUTCOME_TRY(utxo_id.output_index, decode_unsigned<uint32_t>(enc));
    return utxo_id;
}

Result<TransferableOutput> decode_transferable_output(byte_string_view &enc)
{
    TransferableOutput output;
    BOOST_OUTCOME_TRY(output.asset_id, decode_bytes32(enc));
    BOOST_OUTCOME_TRY(output.output, decode_transfer_output(enc));
    return output;
}

Result<TransferableInput> decode_transferable_input(byte_string_view &enc)
{
    TransferableInput input;
    BOOST_OUTCOME_TRY(input.utxo_id, decode_utxo_id(enc));
    BOOST_OUTCOME_TRY(input.asset_id, decode_bytes32(enc));
    BOOST_OUTCOME_TRY(input.input, decode_transfer_input(enc));
    return input;
}

Result<BaseTx> decode_base_tx(byte_string_view &enc)
{
    BaseTx base;
    BOOST_OUTCOME_TRY(base.network_id, decode_unsigned<uint32_t>(enc));
    BOOST_OUTCOME_TRY(base.blockchain_id, decode_bytes32(enc));
    BOOST_OUTCOME_TRY(
        base.outputs,
        decode_list<TransferableOutput>(
            enc, TRANSFERABLE_OUTPUT_MIN_SIZE, decode_transferable_output));
    BOOST_OUTCOME_TRY(
        base.inputs,
        decode_list<TransferableInput>(
            enc, TRANSFERABLE_INPUT_MIN_SIZE, decode_transferable_input));
    BOOST_OUTCOME_TRY(base.memo, decode_bytes(enc));
    return base;
}

Result<SubnetAuth> decode_subnet_auth(byte_string_view &enc)
{
    SubnetAuth auth;
    BOOST_OUTCOME_TRY(decode_type_id(enc, INPUT_TYPE_ID));
    BOOST_OUTCOME_TRY(
        auth.signature_indices,
        decode_list<uint32_t>(
            enc, sizeof(uint32_t), decode_unsigned<uint32_t>));
    return auth;
}

Result<Validator> decode_validator(byte_string_view &enc)
{
    Validator validator;
    BOOST_OUTCOME_TRY(validator.node_id, decode_address(enc));
    BOOST_OUTCOME_TRY(validator.start_time, decode_unsigned<uint64_t>(enc));
    BOOST_OUTCOME_TRY(validator.end_time, decode_unsigned<uint64_t>(enc));
    BOOST_OUTCOME_TRY(validator.weight, decode_unsigned<uint64_t>(enc));
    return validator;
}

Result<ProofOfPossession> decode_proof_of_possession(byte_string_view &enc)
{
    ProofOfPossession pop;
    BOOST_OUTCOME_TRY(pop.public_key, decode_byte_string_fixed<48>(enc));
    BOOST_OUTCOME_TRY(pop.signature, decode_byte_string_fixed<96>(enc));
    return pop;
}

Result<Credential> decode_credential(byte_string_view &enc)
{
    Credential cred;
    BOOST_OUTCOME_TRY(decode_type_id(enc, CREDENTIAL_TYPE_ID));
    BOOST_OUTCOME_TRY(
        cred.signatures,
        decode_list<Signature>(
            enc,
            SIGNATURE_SIZE,
            decode_byte_string_fixed<SIGNATURE_SIZE>));
    return cred;
}

COSIGN_CODEC_NAMESPACE_END
