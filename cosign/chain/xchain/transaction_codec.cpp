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
#include <cosign/chain/config.hpp>
#include <cosign/chain/xchain/transaction.hpp>
#include <cosign/chain/xchain/transaction_codec.hpp>
#include <cosign/codec/decode.hpp>
#include <cosign/codec/decode_error.hpp>
#include <cosign/codec/encode.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/bytes.hpp>
#include <cosign/core/result.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>
#include <variant>

COSIGN_XCHAIN_NAMESPACE_BEGIN

using namespace codec;

namespace
{
    constexpr size_t FX_OUTPUT_MIN_SIZE = 4 + OUTPUT_OWNERS_MIN_SIZE;
    constexpr size_t INITIAL_STATE_MIN_SIZE = 4 + 4;
    constexpr size_t OPERATION_MIN_SIZE =
        32 + 4 + 4 + 4 + OUTPUT_OWNERS_MIN_SIZE + 8 + OUTPUT_OWNERS_MIN_SIZE;

    byte_string encode_initial_state(InitialState const &state)
    {
        return encode_unsigned(state.fx_index) +
               encode_list(state.outputs, encode_fx_output);
    }

    Result<InitialState> decode_initial_state(byte_string_view &enc)
    {
        InitialState state;
        BOOST_OUTCOME_TRY(state.fx_index, decode_unsigned<uint32_t>(enc));
        BOOST_OUTCOME_TRY(
            state.outputs,
            decode_list<FxOutput>(enc, FX_OUTPUT_MIN_SIZE, decode_fx_output));
        return state;
    }

    // the embedded mint and transfer outputs carry no type id of their own
    byte_string encode_mint_operation(MintOperation const &op)
    {
        byte_string encoding = encode_type_id(MINT_OPERATION_TYPE_ID);
        encoding +=
            encode_list(op.signature_indices, encode_unsigned<uint32_t>);
        encoding += encode_output_owners(op.mint_output.owners);
        encoding += encode_unsigned(op.transfer_output.amount);
        encoding += encode_output_owners(op.transfer_output.owners);
        return encoding;
    }

    Result<MintOperation> decode_mint_operation(byte_string_view &enc)
    {
        MintOperation op;
        BOOST_OUTCOME_TRY(decode_type_id(enc, MINT_OPERATION_TYPE_ID));
        BOOST_OUTCOME_TRY(
            op.signature_indices,
            decode_list<uint32_t>(
                enc, sizeof(uint32_t), decode_unsigned<uint32_t>));
        BOOST_OUTCOME_TRY(op.mint_output.owners, decode_output_owners(enc));
        BOOST_OUTCOME_TRY(
            op.transfer_output.amount, decode_unsigned<uint64_t>(enc));
        BOOST_OUTCOME_TRY(
            op.transfer_output.owners, decode_output_owners(enc));
        return op;
    }

    // Encode

    byte_string encode_fields(BaseTransactionTx const &tx)
    {
        return encode_base_tx(tx.base);
    }

    byte_string encode_fields(CreateAssetTx const &tx)
    {
        byte_string encoding = encode_base_tx(tx.base);
        encoding += encode_string(tx.asset_name);
        encoding += encode_string(tx.symbol);
        encoding += encode_unsigned(tx.denomination);
        encoding += encode_list(tx.initial_states, encode_initial_state);
        return encoding;
    }

    byte_string encode_fields(OperationTx const &tx)
    {
        return encode_base_tx(tx.base) +
               encode_list(tx.operations, encode_operation);
    }

    byte_string encode_fields(ImportTx const &tx)
    {
        byte_string encoding = encode_base_tx(tx.base);
        encoding += encode_bytes32(tx.source_chain);
        encoding += encode_list(tx.imported_inputs, encode_transferable_input);
        return encoding;
    }

    byte_string encode_fields(ExportTx const &tx)
    {
        byte_string encoding = encode_base_tx(tx.base);
        encoding += encode_bytes32(tx.destination_chain);
        encoding +=
            encode_list(tx.exported_outputs, encode_transferable_output);
        return encoding;
    }

    // Decode

    Result<BaseTransactionTx> decode_base_transaction_tx(byte_string_view &enc)
    {
        BaseTransactionTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        return tx;
    }

    Result<CreateAssetTx> decode_create_asset_tx(byte_string_view &enc)
    {
        CreateAssetTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.asset_name, decode_string(enc));
        BOOST_OUTCOME_TRY(tx.symbol, decode_string(enc));
        BOOST_OUTCOME_TRY(tx.denomination, decode_unsigned<uint8_t>(enc));
        BOOST_OUTCOME_TRY(
            tx.initial_states,
            decode_list<InitialState>(
                enc, INITIAL_STATE_MIN_SIZE, decode_initial_state));
        return tx;
    }

    Result<OperationTx> decode_operation_tx(byte_string_view &enc)
    {
        OperationTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(
            tx.operations,
            decode_list<Operation>(enc, OPERATION_MIN_SIZE, decode_operation));
        return tx;
    }

    Result<ImportTx> decode_import_tx(byte_string_view &enc)
    {
        ImportTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.source_chain, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(
            tx.imported_inputs,
            decode_list<TransferableInput>(
                enc, TRANSFERABLE_INPUT_MIN_SIZE, decode_transferable_input));
        return tx;
    }

    Result<ExportTx> decode_export_tx(byte_string_view &enc)
    {
        ExportTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.destination_chain, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(
            tx.exported_outputs,
            decode_list<TransferableOutput>(
                enc,
                TRANSFERABLE_OUTPUT_MIN_SIZE,
                decode_transferable_output));
        return tx;
    }

    template <typename T>
    Result<UnsignedTransaction> widen(Result<T> &&result)
    {
        BOOST_OUTCOME_TRY(auto tx, std::move(result));
        return UnsignedTransaction{std::move(tx)};
    }
}

// Encode

byte_string encode_fx_output(FxOutput const &output)
{
    if (std::holds_alternative<TransferOutput>(output)) {
        return encode_transfer_output(std::get<TransferOutput>(output));
    }
    return encode_mint_output(std::get<MintOutput>(output));
}

byte_string encode_operation(Operation const &op)
{
    byte_string encoding = encode_bytes32(op.asset_id);
    encoding += encode_list(op.utxo_ids, encode_utxo_id);
    encoding += encode_mint_operation(op.op);
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

Result<FxOutput> decode_fx_output(byte_string_view &enc)
{
    // peek at the type id; the component decoders consume it themselves
    auto peek = enc;
    BOOST_OUTCOME_TRY(auto const type_id, decode_unsigned<uint32_t>(peek));
    switch (type_id) {
    case TRANSFER_OUTPUT_TYPE_ID: {
        BOOST_OUTCOME_TRY(auto output, decode_transfer_output(enc));
        return FxOutput{std::move(output)};
    }
    case MINT_OUTPUT_TYPE_ID: {
        BOOST_OUTCOME_TRY(auto output, decode_mint_output(enc));
        return FxOutput{std::move(output)};
    }
    default:
        return DecodeError::UnknownTypeId;
    }
}

Result<Operation> decode_operation(byte_string_view &enc)
{
    Operation op;
    BOOST_OUTCOME_TRY(op.asset_id, decode_bytes32(enc));
    BOOST_OUTCOME_TRY(
        op.utxo_ids,
        decode_list<UtxoId>(enc, 32 + 4, decode_utxo_id));
    BOOST_OUTCOME_TRY(op.op, decode_mint_operation(enc));
    return op;
}

Result<UnsignedTransaction> decode_transaction_body(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const type_id, decode_unsigned<uint32_t>(enc));
    switch (type_id) {
    case BaseTransactionTx::type_id:
        return widen(decode_base_transaction_tx(enc));
    case CreateAssetTx::type_id:
        return widen(decode_create_asset_tx(enc));
    case OperationTx::type_id:
        return widen(decode_operation_tx(enc));
    case ImportTx::type_id:
        return widen(decode_import_tx(enc));
    case ExportTx::type_id:
        return widen(decode_export_tx(enc));
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

COSIGN_XCHAIN_NAMESPACE_END
