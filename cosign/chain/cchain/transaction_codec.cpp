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

#include <cosign/chain/cchain/transaction.hpp>
#include <cosign/chain/cchain/transaction_codec.hpp>
#include <cosign/chain/codec/components_codec.hpp>
#include <cosign/chain/components.hpp>
#include <cosign/chain/config.hpp>
#include <cosign/codec/decode.hpp>
#include <cosign/codec/decode_error.hpp>
#include <cosign/codec/encode.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/result.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>
#include <variant>

COSIGN_CCHAIN_NAMESPACE_BEGIN

using namespace codec;

namespace
{
    constexpr size_t EVM_OUTPUT_MIN_SIZE = 20 + 8 + 32;
    constexpr size_t EVM_INPUT_MIN_SIZE = 20 + 8 + 32 + 8;

    byte_string encode_fields(ImportTx const &tx)
    {
        byte_string encoding = encode_unsigned(tx.network_id);
        encoding += encode_bytes32(tx.blockchain_id);
        encoding += encode_bytes32(tx.source_chain);
        encoding += encode_list(tx.imported_inputs, encode_transferable_input);
        encoding += encode_list(tx.outputs, encode_evm_output);
        return encoding;
    }

    byte_string encode_fields(ExportTx const &tx)
    {
        byte_string encoding = encode_unsigned(tx.network_id);
        encoding += encode_bytes32(tx.blockchain_id);
        encoding += encode_bytes32(tx.destination_chain);
        encoding += encode_list(tx.inputs, encode_evm_input);
        encoding +=
            encode_list(tx.exported_outputs, encode_transferable_output);
        return encoding;
    }

    Result<ImportTx> decode_import_tx(byte_string_view &enc)
    {
        ImportTx tx;
        BOOST_OUTCOME_TRY(tx.network_id, decode_unsigned<uint32_t>(enc));
        BOOST_OUTCOME_TRY(tx.blockchain_id, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(tx.source_chain, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(
            tx.imported_inputs,
            decode_list<TransferableInput>(
                enc, TRANSFERABLE_INPUT_MIN_SIZE, decode_transferable_input));
        BOOST_OUTCOME_TRY(
            tx.outputs,
            decode_list<EvmOutput>(
                enc, EVM_OUTPUT_MIN_SIZE, decode_evm_output));
        return tx;
    }

    Result<ExportTx> decode_export_tx(byte_string_view &enc)
    {
        ExportTx tx;
        BOOST_OUTCOME_TRY(tx.network_id, decode_unsigned<uint32_t>(enc));
        BOOST_OUTCOME_TRY(tx.blockchain_id, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(tx.destination_chain, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(
            tx.inputs,
            decode_list<EvmInput>(enc, EVM_INPUT_MIN_SIZE, decode_evm_input));
        BOOST_OUTCOME_TRY(
            tx.exported_outputs,
            decode_list<TransferableOutput>(
                enc,
                TRANSFERABLE_OUTPUT_MIN_SIZE,
                decode_transferable_output));
        return tx;
    }
}

// Encode

byte_string encode_evm_output(EvmOutput const &output)
{
    byte_string encoding = encode_address(output.address);
    encoding += encode_unsigned(output.amount);
    encoding += encode_bytes32(output.asset_id);
    return encoding;
}

byte_string encode_evm_input(EvmInput const &input)
{
    byte_string encoding = encode_address(input.address);
    encoding += encode_unsigned(input.amount);
    encoding += encode_bytes32(input.asset_id);
    encoding += encode_unsigned(input.nonce);
    return encoding;
}

byte_string encode_transaction_body(UnsignedTransaction const &tx)
{
    return std::visit(
        [](auto const &t) {
            using T = std::decay_t<decltype(t)>;
            return encode_type_id(T::type_id) + encode_fields(t);
        },
        tx);
}

byte_string encode_unsigned_transaction(UnsignedTransaction const &tx)
{
    return encode_codec_version() + encode_transaction_body(tx);
}

// Decode

Result<EvmOutput> decode_evm_output(byte_string_view &enc)
{
    EvmOutput output;
    BOOST_OUTCOME_TRY(output.address, decode_address(enc));
    BOOST_OUTCOME_TRY(output.amount, decode_unsigned<uint64_t>(enc));
    BOOST_OUTCOME_TRY(output.asset_id, decode_bytes32(enc));
    return output;
}

Result<EvmInput> decode_evm_input(byte_string_view &enc)
{
    EvmInput input;
    BOOST_OUTCOME_TRY(input.address, decode_address(enc));
    BOOST_OUTCOME_TRY(input.amount, decode_unsigned<uint64_t>(enc));
    BOOST_OUTCOME_TRY(input.asset_id, decode_bytes32(enc));
    BOOST_OUTCOME_TRY(input.nonce, decode_unsigned<uint64_t>(enc));
    return input;
}

Result<UnsignedTransaction> decode_transaction_body(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const type_id, decode_unsigned<uint32_t>(enc));
    switch (type_id) {
    case ImportTx::type_id: {
        BOOST_OUTCOME_TRY(auto tx, decode_import_tx(enc));
        return UnsignedTransaction{std::move(tx)};
    }
    case ExportTx::type_id: {
        BOOST_OUTCOME_TRY(auto tx, decode_export_tx(enc));
        return UnsignedTransaction{std::move(tx)};
    }
    default:
        return DecodeError::UnknownTypeId;
    }
}

Result<UnsignedTransaction> decode_unsigned_transaction(byte_string_view enc)
{
    BOOST_OUTCOME_TRY(decode_codec_version(enc));
    BOOST_OUTCOME_TRY(auto tx, decode_transaction_body(enc));
    BOOST_OUTCOME_TRY(decode_end(enc));
    return tx;
}

COSIGN_CCHAIN_NAMESPACE_END
