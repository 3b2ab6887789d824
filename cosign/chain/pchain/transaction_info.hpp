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
#include <cosign/chain/pchain/transaction.hpp>
#include <cosign/core/bytes.hpp>

#include <concepts>
#include <cstdint>
#include <optional>
#include <string_view>

COSIGN_PCHAIN_NAMESPACE_BEGIN

template <typename T>
concept HasSubnetId = requires(T const &tx) {
    { tx.subnet_id } -> std::convertible_to<bytes32_t const &>;
};

/// Subnet governance transactions: they name a subnet and carry the indices
/// of the control keys that must sign for it
template <typename T>
concept SubnetGovernance = HasSubnetId<T> && requires(T const &tx) {
    { tx.subnet_auth } -> std::convertible_to<SubnetAuth const &>;
};

static_assert(SubnetGovernance<AddSubnetValidatorTx>);
static_assert(SubnetGovernance<CreateChainTx>);
static_assert(SubnetGovernance<RemoveSubnetValidatorTx>);
static_assert(SubnetGovernance<TransformSubnetTx>);
static_assert(SubnetGovernance<TransferSubnetOwnershipTx>);
static_assert(SubnetGovernance<ConvertSubnetToL1Tx>);
static_assert(!SubnetGovernance<DisableL1ValidatorTx>);
static_assert(!SubnetGovernance<AddPermissionlessValidatorTx>);

std::string_view kind_name(UnsignedTransaction const &);

/// 0 for the proposal transactions, which are not bound to a network
uint32_t network_id(UnsignedTransaction const &);

std::optional<bytes32_t> blockchain_id(UnsignedTransaction const &);

std::optional<bytes32_t> subnet_id(UnsignedTransaction const &);

/// Authorization indices of a subnet governance transaction
std::optional<SubnetAuth> subnet_auth(UnsignedTransaction const &);

bool is_subnet_governance(UnsignedTransaction const &);

std::string_view hrp(UnsignedTransaction const &);

COSIGN_PCHAIN_NAMESPACE_END
