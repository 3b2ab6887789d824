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
#include <cosign/chain/config.hpp>
#include <cosign/core/address.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/bytes.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

COSIGN_PCHAIN_NAMESPACE_BEGIN

inline constexpr uint32_t EMPTY_SIGNER_TYPE_ID = 0x1b;
inline constexpr uint32_t PROOF_OF_POSSESSION_TYPE_ID = 0x1c;

struct EmptySigner
{
    friend bool operator==(EmptySigner const &, EmptySigner const &) = default;
};

using StakingSigner = std::variant<EmptySigner, ProofOfPossession>;

/// Owner of an L1 validator's remaining balance or of its deactivation right
struct L1Owner
{
    uint32_t threshold{};
    std::vector<Address> addresses{};

    friend bool operator==(L1Owner const &, L1Owner const &) = default;
};

struct L1Validator
{
    byte_string node_id{};
    uint64_t weight{};
    uint64_t balance{};
    ProofOfPossession signer{};
    L1Owner remaining_balance_owner{};
    L1Owner deactivation_owner{};

    friend bool operator==(L1Validator const &, L1Validator const &) = default;
};

struct AddValidatorTx
{
    static constexpr uint32_t type_id = 0x0c;
    static constexpr std::string_view name = "AddValidatorTx";

    BaseTx base{};
    Validator validator{};
    std::vector<TransferableOutput> stake_outputs{};
    OutputOwners rewards_owner{};
    uint32_t delegation_shares{};

    friend bool
    operator==(AddValidatorTx const &, AddValidatorTx const &) = default;
};

struct AddSubnetValidatorTx
{
    static constexpr uint32_t type_id = 0x0d;
    static constexpr std::string_view name = "AddSubnetValidatorTx";

    BaseTx base{};
    Validator validator{};
    bytes32_t subnet_id{};
    SubnetAuth subnet_auth{};

    friend bool operator==(
        AddSubnetValidatorTx const &, AddSubnetValidatorTx const &) = default;
};

struct AddDelegatorTx
{
    static constexpr uint32_t type_id = 0x0e;
    static constexpr std::string_view name = "AddDelegatorTx";

    BaseTx base{};
    Validator validator{};
    std::vector<TransferableOutput> stake_outputs{};
    OutputOwners rewards_owner{};

    friend bool
    operator==(AddDelegatorTx const &, AddDelegatorTx const &) = default;
};

struct CreateChainTx
{
    static constexpr uint32_t type_id = 0x0f;
    static constexpr std::string_view name = "CreateChainTx";

    BaseTx base{};
    bytes32_t subnet_id{};
    std::string chain_name{};
    bytes32_t vm_id{};
    std::vector<bytes32_t> fx_ids{};
    byte_string genesis_data{};
    SubnetAuth subnet_auth{};

    friend bool
    operator==(CreateChainTx const &, CreateChainTx const &) = default;
};

struct CreateSubnetTx
{
    static constexpr uint32_t type_id = 0x10;
    static constexpr std::string_view name = "CreateSubnetTx";

    BaseTx base{};
    OutputOwners owner{};

    friend bool
    operator==(CreateSubnetTx const &, CreateSubnetTx const &) = default;
};

struct ImportTx
{
    static constexpr uint32_t type_id = 0x11;
    static constexpr std::string_view name = "ImportTx";

    BaseTx base{};
    bytes32_t source_chain{};
    std::vector<TransferableInput> imported_inputs{};

    friend bool operator==(ImportTx const &, ImportTx const &) = default;
};

struct ExportTx
{
    static constexpr uint32_t type_id = 0x12;
    static constexpr std::string_view name = "ExportTx";

    BaseTx base{};
    bytes32_t destination_chain{};
    std::vector<TransferableOutput> exported_outputs{};

    friend bool operator==(ExportTx const &, ExportTx const &) = default;
};

struct AdvanceTimeTx
{
    static constexpr uint32_t type_id = 0x13;
    static constexpr std::string_view name = "AdvanceTimeTx";

    uint64_t time{};

    friend bool
    operator==(AdvanceTimeTx const &, AdvanceTimeTx const &) = default;
};

struct RewardValidatorTx
{
    static constexpr uint32_t type_id = 0x14;
    static constexpr std::string_view name = "RewardValidatorTx";

    bytes32_t tx_id{};

    friend bool
    operator==(RewardValidatorTx const &, RewardValidatorTx const &) = default;
};

struct RemoveSubnetValidatorTx
{
    static constexpr uint32_t type_id = 0x17;
    static constexpr std::string_view name = "RemoveSubnetValidatorTx";

    BaseTx base{};
    Address node_id{};
    bytes32_t subnet_id{};
    SubnetAuth subnet_auth{};

    friend bool operator==(
        RemoveSubnetValidatorTx const &,
        RemoveSubnetValidatorTx const &) = default;
};

struct TransformSubnetTx
{
    static constexpr uint32_t type_id = 0x18;
    static constexpr std::string_view name = "TransformSubnetTx";

    BaseTx base{};
    bytes32_t subnet_id{};
    bytes32_t asset_id{};
    uint64_t initial_supply{};
    uint64_t maximum_supply{};
    uint64_t min_consumption_rate{};
    uint64_t max_consumption_rate{};
    uint64_t min_validator_stake{};
    uint64_t max_validator_stake{};
    uint32_t min_stake_duration{};
    uint32_t max_stake_duration{};
    uint32_t min_delegation_fee{};
    uint64_t min_delegator_stake{};
    uint8_t max_validator_weight_factor{};
    uint32_t uptime_requirement{};
    SubnetAuth subnet_auth{};

    friend bool
    operator==(TransformSubnetTx const &, TransformSubnetTx const &) = default;
};

struct AddPermissionlessValidatorTx
{
    static constexpr uint32_t type_id = 0x19;
    static constexpr std::string_view name = "AddPermissionlessValidatorTx";

    BaseTx base{};
    Validator validator{};
    bytes32_t subnet_id{};
    StakingSigner signer{};
    std::vector<TransferableOutput> stake_outputs{};
    OutputOwners validator_rewards_owner{};
    OutputOwners delegator_rewards_owner{};
    uint32_t delegation_shares{};

    friend bool operator==(
        AddPermissionlessValidatorTx const &,
        AddPermissionlessValidatorTx const &) = default;
};

struct AddPermissionlessDelegatorTx
{
    static constexpr uint32_t type_id = 0x1a;
    static constexpr std::string_view name = "AddPermissionlessDelegatorTx";

    BaseTx base{};
    Validator validator{};
    bytes32_t subnet_id{};
    std::vector<TransferableOutput> stake_outputs{};
    OutputOwners rewards_owner{};

    friend bool operator==(
        AddPermissionlessDelegatorTx const &,
        AddPermissionlessDelegatorTx const &) = default;
};

struct TransferSubnetOwnershipTx
{
    static constexpr uint32_t type_id = 0x21;
    static constexpr std::string_view name = "TransferSubnetOwnershipTx";

    BaseTx base{};
    bytes32_t subnet_id{};
    SubnetAuth subnet_auth{};
    OutputOwners owner{};

    friend bool operator==(
        TransferSubnetOwnershipTx const &,
        TransferSubnetOwnershipTx const &) = default;
};

struct BaseTransactionTx
{
    static constexpr uint32_t type_id = 0x22;
    static constexpr std::string_view name = "BaseTx";

    BaseTx base{};

    friend bool
    operator==(BaseTransactionTx const &, BaseTransactionTx const &) = default;
};

struct ConvertSubnetToL1Tx
{
    static constexpr uint32_t type_id = 0x23;
    static constexpr std::string_view name = "ConvertSubnetToL1Tx";

    BaseTx base{};
    bytes32_t subnet_id{};
    bytes32_t chain_id{};
    byte_string manager_address{};
    std::vector<L1Validator> validators{};
    SubnetAuth subnet_auth{};

    friend bool operator==(
        ConvertSubnetToL1Tx const &, ConvertSubnetToL1Tx const &) = default;
};

struct RegisterL1ValidatorTx
{
    static constexpr uint32_t type_id = 0x24;
    static constexpr std::string_view name = "RegisterL1ValidatorTx";

    BaseTx base{};
    uint64_t balance{};
    byte_string_fixed<96> proof_of_possession{};
    byte_string message{};

    friend bool operator==(
        RegisterL1ValidatorTx const &, RegisterL1ValidatorTx const &) = default;
};

struct SetL1ValidatorWeightTx
{
    static constexpr uint32_t type_id = 0x25;
    static constexpr std::string_view name = "SetL1ValidatorWeightTx";

    BaseTx base{};
    byte_string message{};

    friend bool operator==(
        SetL1ValidatorWeightTx const &,
        SetL1ValidatorWeightTx const &) = default;
};

struct IncreaseL1ValidatorBalanceTx
{
    static constexpr uint32_t type_id = 0x26;
    static constexpr std::string_view name = "IncreaseL1ValidatorBalanceTx";

    BaseTx base{};
    bytes32_t validation_id{};
    uint64_t balance{};

    friend bool operator==(
        IncreaseL1ValidatorBalanceTx const &,
        IncreaseL1ValidatorBalanceTx const &) = default;
};

struct DisableL1ValidatorTx
{
    static constexpr uint32_t type_id = 0x27;
    static constexpr std::string_view name = "DisableL1ValidatorTx";

    BaseTx base{};
    bytes32_t validation_id{};
    SubnetAuth disable_auth{};

    friend bool operator==(
        DisableL1ValidatorTx const &, DisableL1ValidatorTx const &) = default;
};

using UnsignedTransaction = std::variant<
    AddValidatorTx, AddSubnetValidatorTx, AddDelegatorTx, CreateChainTx,
    CreateSubnetTx, ImportTx, ExportTx, AdvanceTimeTx, RewardValidatorTx,
    RemoveSubnetValidatorTx, TransformSubnetTx, AddPermissionlessValidatorTx,
    AddPermissionlessDelegatorTx, TransferSubnetOwnershipTx, BaseTransactionTx,
    ConvertSubnetToL1Tx, RegisterL1ValidatorTx, SetL1ValidatorWeightTx,
    IncreaseL1ValidatorBalanceTx, DisableL1ValidatorTx>;

COSIGN_PCHAIN_NAMESPACE_END
