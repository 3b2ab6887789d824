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
#include <cosign/chain/credential.hpp>
#include <cosign/chain/pchain/signed_transaction.hpp>
#include <cosign/chain/pchain/transaction.hpp>
#include <cosign/chain/pchain/transaction_codec.hpp>
#include <cosign/codec/decode.hpp>
#include <cosign/codec/decode_error.hpp>
#include <cosign/codec/encode.hpp>
#include <cosign/core/address.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/bytes.hpp>
#include <cosign/core/sha256.hpp>
#include <cosign/core/likely.h>
#include <cosign/core/result.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>
#include <variant>

COSIGN_PCHAIN_NAMESPACE_BEGIN

using namespace codec;

namespace
{
    // node id bytes, weight, balance, proof of possession, two empty owners
    constexpr size_t L1_VALIDATOR_MIN_SIZE = 4 + 8 + 8 + 48 + 96 + 8 + 8;

    byte_string encode_l1_owner(L1Owner const &owner)
    {
        return encode_unsigned(owner.threshold) +
               encode_list(owner.addresses, encode_address);
    }

    Result<L1Owner> decode_l1_owner(byte_string_view &enc)
    {
        L1Owner owner;
        BOOST_OUTCOME_TRY(owner.threshold, decode_unsigned<uint32_t>(enc));
        BOOST_OUTCOME_TRY(
            owner.addresses,
            decode_list<Address>(enc, sizeof(Address), decode_address));
        return owner;
    }

    byte_string encode_stake_outputs(std::vector<TransferableOutput> const &outs)
    {
        return encode_list(outs, encode_transferable_output);
    }

    Result<std::vector<TransferableOutput>>
    decode_stake_outputs(byte_string_view &enc)
    {
        return decode_list<TransferableOutput>(
            enc, TRANSFERABLE_OUTPUT_MIN_SIZE, decode_transferable_output);
    }

    // Encode

    byte_string encode_fields(AddValidatorTx const &tx)
    {
        byte_string encoding = encode_base_tx(tx.base);
        encoding += encode_validator(tx.validator);
        encoding += encode_stake_outputs(tx.stake_outputs);
        encoding += encode_owner(tx.rewards_owner);
        encoding += encode_unsigned(tx.delegation_shares);
        return encoding;
    }

    byte_string encode_fields(AddSubnetValidatorTx const &tx)
    {
        byte_string encoding = encode_base_tx(tx.base);
        encoding += encode_validator(tx.validator);
        encoding += encode_bytes32(tx.subnet_id);
        encoding += encode_subnet_auth(tx.subnet_auth);
        return encoding;
    }

    byte_string encode_fields(AddDelegatorTx const &tx)
    {
        byte_string encoding = encode_base_tx(tx.base);
        encoding += encode_validator(tx.validator);
        encoding += encode_stake_outputs(tx.stake_outputs);
        encoding += encode_owner(tx.rewards_owner);
        return encoding;
    }

    byte_string encode_fields(CreateChainTx const &tx)
    {
        byte_string encoding = encode_base_tx(tx.base);
        encoding += encode_bytes32(tx.subnet_id);
        encoding += encode_string(tx.chain_name);
        encoding += encode_bytes32(tx.vm_id);
        encoding += encode_list(tx.fx_ids, encode_bytes32);
        encoding += encode_bytes(tx.genesis_data);
        encoding += encode_subnet_auth(tx.subnet_auth);
        return encoding;
    }

    byte_string encode_fields(CreateSubnetTx const &tx)
    {
        return encode_base_tx(tx.base) + encode_owner(tx.owner);
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

    byte_string encode_fields(AdvanceTimeTx const &tx)
    {
        return encode_unsigned(tx.time);
    }

    byte_string encode_fields(RewardValidatorTx const &tx)
    {
        return encode_bytes32(tx.tx_id);
    }

    byte_string encode_fields(RemoveSubnetValidatorTx const &tx)
    {
        byte_string encoding = encode_base_tx(tx.base);
        encoding += encode_address(tx.node_id);
        encoding += encode_bytes32(tx.subnet_id);
        encoding += encode_subnet_auth(tx.subnet_auth);
        return encoding;
    }

    byte_string encode_fields(TransformSubnetTx const &tx)
    {
        byte_string encoding = encode_base_tx(tx.base);
        encoding += encode_bytes32(tx.subnet_id);
        encoding += encode_bytes32(tx.asset_id);
        encoding += encode_unsigned(tx.initial_supply);
        encoding += encode_unsigned(tx.maximum_supply);
        encoding += encode_unsigned(tx.min_consumption_rate);
        encoding += encode_unsigned(tx.max_consumption_rate);
        encoding += encode_unsigned(tx.min_validator_stake);
        encoding += encode_unsigned(tx.max_validator_stake);
        encoding += encode_unsigned(tx.min_stake_duration);
        encoding += encode_unsigned(tx.max_stake_duration);
        encoding += encode_unsigned(tx.min_delegation_fee);
        encoding += encode_unsigned(tx.min_delegator_stake);
        encoding += encode_unsigned(tx.max_validator_weight_factor);
        encoding += encode_unsigned(tx.uptime_requirement);
        encoding += encode_subnet_auth(tx.subnet_auth);
        return encoding;
    }

    byte_string encode_fields(AddPermissionlessValidatorTx const &tx)
    {
        byte_string encoding = encode_base_tx(tx.base);
        encoding += encode_validator(tx.validator);
        encoding += encode_bytes32(tx.subnet_id);
        encoding += encode_staking_signer(tx.signer);
        encoding += encode_stake_outputs(tx.stake_outputs);
        encoding += encode_owner(tx.validator_rewards_owner);
        encoding += encode_owner(tx.delegator_rewards_owner);
        encoding += encode_unsigned(tx.delegation_shares);
        return encoding;
    }

    byte_string encode_fields(AddPermissionlessDelegatorTx const &tx)
    {
        byte_string encoding = encode_base_tx(tx.base);
        encoding += encode_validator(tx.validator);
        encoding += encode_bytes32(tx.subnet_id);
        encoding += encode_stake_outputs(tx.stake_outputs);
        encoding += encode_owner(tx.rewards_owner);
        return encoding;
    }

    byte_string encode_fields(TransferSubnetOwnershipTx const &tx)
    {
        byte_string encoding = encode_base_tx(tx.base);
        encoding += encode_bytes32(tx.subnet_id);
        encoding += encode_subnet_auth(tx.subnet_auth);
        encoding += encode_owner(tx.owner);
        return encoding;
    }

    byte_string encode_fields(BaseTransactionTx const &tx)
    {
        return encode_base_tx(tx.base);
    }

    byte_string encode_fields(ConvertSubnetToL1Tx const &tx)
    {
        byte_string encoding = encode_base_tx(tx.base);
        encoding += encode_bytes32(tx.subnet_id);
        encoding += encode_bytes32(tx.chain_id);
        encoding += encode_bytes(tx.manager_address);
        encoding += encode_list(tx.validators, encode_l1_validator);
        encoding += encode_subnet_auth(tx.subnet_auth);
        return encoding;
    }

    byte_string encode_fields(RegisterL1ValidatorTx const &tx)
    {
        byte_string encoding = encode_base_tx(tx.base);
        encoding += encode_unsigned(tx.balance);
        encoding += encode_byte_string_fixed(tx.proof_of_possession);
        encoding += encode_bytes(tx.message);
        return encoding;
    }

    byte_string encode_fields(SetL1ValidatorWeightTx const &tx)
    {
        return encode_base_tx(tx.base) + encode_bytes(tx.message);
    }

    byte_string encode_fields(IncreaseL1ValidatorBalanceTx const &tx)
    {
        byte_string encoding = encode_base_tx(tx.base);
        encoding += encode_bytes32(tx.validation_id);
        encoding += encode_unsigned(tx.balance);
        return encoding;
    }

    byte_string encode_fields(DisableL1ValidatorTx const &tx)
    {
        byte_string encoding = encode_base_tx(tx.base);
        encoding += encode_bytes32(tx.validation_id);
        encoding += encode_subnet_auth(tx.disable_auth);
        return encoding;
    }

    // Decode

    Result<AddValidatorTx> decode_add_validator_tx(byte_string_view &enc)
    {
        AddValidatorTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.validator, decode_validator(enc));
        BOOST_OUTCOME_TRY(tx.stake_outputs, decode_stake_outputs(enc));
        BOOST_OUTCOME_TRY(tx.rewards_owner, decode_owner(enc));
        BOOST_OUTCOME_TRY(tx.delegation_shares, decode_unsigned<uint32_t>(enc));
        return tx;
    }

    Result<AddSubnetValidatorTx>
    decode_add_subnet_validator_tx(byte_string_view &enc)
    {
        AddSubnetValidatorTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.validator, decode_validator(enc));
        BOOST_OUTCOME_TRY(tx.subnet_id, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(tx.subnet_auth, decode_subnet_auth(enc));
        return tx;
    }

    Result<AddDelegatorTx> decode_add_delegator_tx(byte_string_view &enc)
    {
        AddDelegatorTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.validator, decode_validator(enc));
        BOOST_OUTCOME_TRY(tx.stake_outputs, decode_stake_outputs(enc));
        BOOST_OUTCOME_TRY(tx.rewards_owner, decode_owner(enc));
        return tx;
    }

    Result<CreateChainTx> decode_create_chain_tx(byte_string_view &enc)
    {
        CreateChainTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.subnet_id, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(tx.chain_name, decode_string(enc));
        BOOST_OUTCOME_TRY(tx.vm_id, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(
            tx.fx_ids,
            decode_list<bytes32_t>(enc, sizeof(bytes32_t), decode_bytes32));
        BOOST_OUTCOME_TRY(tx.genesis_data, decode_bytes(enc));
        BOOST_OUTCOME_TRY(tx.subnet_auth, decode_subnet_auth(enc));
        return tx;
    }

    Result<CreateSubnetTx> decode_create_subnet_tx(byte_string_view &enc)
    {
        CreateSubnetTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.owner, decode_owner(enc));
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

    Result<AdvanceTimeTx> decode_advance_time_tx(byte_string_view &enc)
    {
        AdvanceTimeTx tx;
        BOOST_OUTCOME_TRY(tx.time, decode_unsigned<uint64_t>(enc));
        return tx;
    }

    Result<RewardValidatorTx> decode_reward_validator_tx(byte_string_view &enc)
    {
        RewardValidatorTx tx;
        BOOST_OUTCOME_TRY(tx.tx_id, decode_bytes32(enc));
        return tx;
    }

    Result<RemoveSubnetValidatorTx>
    decode_remove_subnet_validator_tx(byte_string_view &enc)
    {
        RemoveSubnetValidatorTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.node_id, decode_address(enc));
        BOOST_OUTCOME_TRY(tx.subnet_id, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(tx.subnet_auth, decode_subnet_auth(enc));
        return tx;
    }

    Result<TransformSubnetTx> decode_transform_subnet_tx(byte_string_view &enc)
    {
        TransformSubnetTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.subnet_id, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(tx.asset_id, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(tx.initial_supply, decode_unsigned<uint64_t>(enc));
        BOOST_OUTCOME_TRY(tx.maximum_supply, decode_unsigned<uint64_t>(enc));
        BOOST_OUTCOME_TRY(
            tx.min_consumption_rate, decode_unsigned<uint64_t>(enc));
        BOOST_OUTCOME_TRY(
            tx.max_consumption_rate, decode_unsigned<uint64_t>(enc));
        BOOST_OUTCOME_TRY(
            tx.min_validator_stake, decode_unsigned<uint64_t>(enc));
        BOOST_OUTCOME_TRY(
            tx.max_validator_stake, decode_unsigned<uint64_t>(enc));
        BOOST_OUTCOME_TRY(
            tx.min_stake_duration, decode_unsigned<uint32_t>(enc));
        BOOST_OUTCOME_TRY(
            tx.max_stake_duration, decode_unsigned<uint32_t>(enc));
        BOOST_OUTCOME_TRY(
            tx.min_delegation_fee, decode_unsigned<uint32_t>(enc));
        BOOST_OUTCOME_TRY(
            tx.min_delegator_stake, decode_unsigned<uint64_t>(enc));
        BOOST_OUTCOME_TRY(
            tx.max_validator_weight_factor, decode_unsigned<uint8_t>(enc));
        BOOST_OUTCOME_TRY(
            tx.uptime_requirement, decode_unsigned<uint32_t>(enc));
        BOOST_OUTCOME_TRY(tx.subnet_auth, decode_subnet_auth(enc));
        return tx;
    }

    Result<AddPermissionlessValidatorTx>
    decode_add_permissionless_validator_tx(byte_string_view &enc)
    {
        AddPermissionlessValidatorTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.validator, decode_validator(enc));
        BOOST_OUTCOME_TRY(tx.subnet_id, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(tx.signer, decode_staking_signer(enc));
        BOOST_OUTCOME_TRY(tx.stake_outputs, decode_stake_outputs(enc));
        BOOST_OUTCOME_TRY(tx.validator_rewards_owner, decode_owner(enc));
        BOOST_OUTCOME_TRY(tx.delegator_rewards_owner, decode_owner(enc));
        BOOST_OUTCOME_TRY(tx.delegation_shares, decode_unsigned<uint32_t>(enc));
        return tx;
    }

    Result<AddPermissionlessDelegatorTx>
    decode_add_permissionless_delegator_tx(byte_string_view &enc)
    {
        AddPermissionlessDelegatorTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.validator, decode_validator(enc));
        BOOST_OUTCOME_TRY(tx.subnet_id, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(tx.stake_outputs, decode_stake_outputs(enc));
        BOOST_OUTCOME_TRY(tx.rewards_owner, decode_owner(enc));
        return tx;
    }

    Result<TransferSubnetOwnershipTx>
    decode_transfer_subnet_ownership_tx(byte_string_view &enc)
    {
        TransferSubnetOwnershipTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.subnet_id, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(tx.subnet_auth, decode_subnet_auth(enc));
        BOOST_OUTCOME_TRY(tx.owner, decode_owner(enc));
        return tx;
    }

    Result<BaseTransactionTx> decode_base_transaction_tx(byte_string_view &enc)
    {
        BaseTransactionTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        return tx;
    }

    Result<ConvertSubnetToL1Tx>
    decode_convert_subnet_to_l1_tx(byte_string_view &enc)
    {
        ConvertSubnetToL1Tx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.subnet_id, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(tx.chain_id, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(tx.manager_address, decode_bytes(enc));
        BOOST_OUTCOME_TRY(
            tx.validators,
            decode_list<L1Validator>(
                enc, L1_VALIDATOR_MIN_SIZE, decode_l1_validator));
        BOOST_OUTCOME_TRY(tx.subnet_auth, decode_subnet_auth(enc));
        return tx;
    }

    Result<RegisterL1ValidatorTx>
    decode_register_l1_validator_tx(byte_string_view &enc)
    {
        RegisterL1ValidatorTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.balance, decode_unsigned<uint64_t>(enc));
        BOOST_OUTCOME_TRY(
            tx.proof_of_possession, decode_byte_string_fixed<96>(enc));
        BOOST_OUTCOME_TRY(tx.message, decode_bytes(enc));
        return tx;
    }

    Result<SetL1ValidatorWeightTx>
    decode_set_l1_validator_weight_tx(byte_string_view &enc)
    {
        SetL1ValidatorWeightTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.message, decode_bytes(enc));
        return tx;
    }

    Result<IncreaseL1ValidatorBalanceTx>
    decode_increase_l1_validator_balance_tx(byte_string_view &enc)
    {
        IncreaseL1ValidatorBalanceTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.validation_id, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(tx.balance, decode_unsigned<uint64_t>(enc));
        return tx;
    }

    Result<DisableL1ValidatorTx>
    decode_disable_l1_validator_tx(byte_string_view &enc)
    {
        DisableL1ValidatorTx tx;
        BOOST_OUTCOME_TRY(tx.base, decode_base_tx(enc));
        BOOST_OUTCOME_TRY(tx.validation_id, decode_bytes32(enc));
        BOOST_OUTCOME_TRY(tx.disable_auth, decode_subnet_auth(enc));
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

byte_string encode_staking_signer(StakingSigner const &signer)
{
    if (std::holds_alternative<EmptySigner>(signer)) {
        return encode_type_id(EMPTY_SIGNER_TYPE_ID);
    }
    return encode_type_id(PROOF_OF_POSSESSION_TYPE_ID) +
           encode_proof_of_possession(std::get<ProofOfPossession>(signer));
}

byte_string encode_l1_validator(L1Validator const &validator)
{
    byte_string encoding = encode_bytes(validator.node_id);
    encoding += encode_unsigned(validator.weight);
    encoding += encode_unsigned(validator.balance);
    encoding += encode_proof_of_possession(validator.signer);
    encoding += encode_l1_owner(validator.remaining_balance_owner);
    encoding += encode_l1_owner(validator.deactivation_owner);
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

byte_string encode_signed_transaction(SignedTransaction const &tx)
{
    byte_string encoding = encode_unsigned_transaction(tx.unsigned_tx);
    encoding += encode_list(tx.credentials, encode_credential);
    return encoding;
}

bytes32_t tx_id(SignedTransaction const &tx)
{
    return sha256(encode_signed_transaction(tx));
}

// Decode

Result<StakingSigner> decode_staking_signer(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const type_id, decode_unsigned<uint32_t>(enc));
    switch (type_id) {
    case EMPTY_SIGNER_TYPE_ID:
        return StakingSigner{EmptySigner{}};
    case PROOF_OF_POSSESSION_TYPE_ID: {
        BOOST_OUTCOME_TRY(auto pop, decode_proof_of_possession(enc));
        return StakingSigner{pop};
    }
    default:
        return DecodeError::UnknownTypeId;
    }
}

Result<L1Validator> decode_l1_validator(byte_string_view &enc)
{
    L1Validator validator;
    BOOST_OUTCOME_TRY(validator.node_id, decode_bytes(enc));
    BOOST_OUTCOME_TRY(validator.weight, decode_unsigned<uint64_t>(enc));
    BOOST_OUTCOME_TRY(validator.balance, decode_unsigned<uint64_t>(enc));
    BOOST_OUTCOME_TRY(validator.signer, decode_proof_of_possession(enc));
    BOOST_OUTCOME_TRY(validator.remaining_balance_owner, decode_l1_owner(enc));
    BOOST_OUTCOME_TRY(validator.deactivation_owner, decode_l1_owner(enc));
    return validator;
}

Result<UnsignedTransaction> decode_transaction_body(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const type_id, decode_unsigned<uint32_t>(enc));
    switch (type_id) {
    case AddValidatorTx::type_id:
        return widen(decode_add_validator_tx(enc));
    case AddSubnetValidatorTx::type_id:
        return widen(decode_add_subnet_validator_tx(enc));
    case AddDelegatorTx::type_id:
        return widen(decode_add_delegator_tx(enc));
    case CreateChainTx::type_id:
        return widen(decode_create_chain_tx(enc));
    case CreateSubnetTx::type_id:
        return widen(decode_create_subnet_tx(enc));
    case ImportTx::type_id:
        return widen(decode_import_tx(enc));
    case ExportTx::type_id:
        return widen(decode_export_tx(enc));
    case AdvanceTimeTx::type_id:
        return widen(decode_advance_time_tx(enc));
    case RewardValidatorTx::type_id:
        return widen(decode_reward_validator_tx(enc));
    case RemoveSubnetValidatorTx::type_id:
        return widen(decode_remove_subnet_validator_tx(enc));
    case TransformSubnetTx::type_id:
        return widen(decode_transform_subnet_tx(enc));
    case AddPermissionlessValidatorTx::type_id:
        return widen(decode_add_permissionless_validator_tx(enc));
    case AddPermissionlessDelegatorTx::type_id:
        return widen(decode_add_permissionless_delegator_tx(enc));
    case TransferSubnetOwnershipTx::type_id:
        return widen(decode_transfer_subnet_ownership_tx(enc));
    case BaseTransactionTx::type_id:
        return widen(decode_base_transaction_tx(enc));
    case ConvertSubnetToL1Tx::type_id:
        return widen(decode_convert_subnet_to_l1_tx(enc));
    case RegisterL1ValidatorTx::type_id:
        return widen(decode_register_l1_validator_tx(enc));
    case SetL1ValidatorWeightTx::type_id:
        return widen(decode_set_l1_validator_weight_tx(enc));
    case IncreaseL1ValidatorBalanceTx::type_id:
        return widen(decode_increase_l1_validator_balance_tx(enc));
    case DisableL1ValidatorTx::type_id:
        return widen(decode_disable_l1_validator_tx(enc));
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

Result<SignedTransaction> decode_signed_transaction(byte_string_view enc)
{
    SignedTransaction tx;
    BOOST_OUTCOME_TRY(decode_codec_version(enc));
    BOOST_OUTCOME_TRY(tx.unsigned_tx, decode_transaction_body(enc));
    BOOST_OUTCOME_TRY(
        tx.credentials,
        decode_list<Credential>(enc, CREDENTIAL_MIN_SIZE, decode_credential));
    BOOST_OUTCOME_TRY(decode_end(enc));
    return tx;
}

COSIGN_PCHAIN_NAMESPACE_END
