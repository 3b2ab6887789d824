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

#include <cosign/core/address.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/bytes.hpp>

#include <concepts>
#include <cstdint>
#include <vector>

COSIGN_NAMESPACE_BEGIN

// secp256k1fx type ids, shared by the registries of all three chains
inline constexpr uint32_t TRANSFER_INPUT_TYPE_ID = 5;
inline constexpr uint32_t MINT_OUTPUT_TYPE_ID = 6;
inline constexpr uint32_t TRANSFER_OUTPUT_TYPE_ID = 7;
inline constexpr uint32_t MINT_OPERATION_TYPE_ID = 8;
inline constexpr uint32_t CREDENTIAL_TYPE_ID = 9;
inline constexpr uint32_t INPUT_TYPE_ID = 10;
inline constexpr uint32_t OUTPUT_OWNERS_TYPE_ID = 11;

struct OutputOwners
{
    uint64_t locktime{};
    uint32_t threshold{};
    std::vector<Address> addresses{};

    friend bool operator==(OutputOwners const &, OutputOwners const &) = default;
};

struct TransferOutput
{
    uint64_t amount{};
    OutputOwners owners{};

    friend bool
    operator==(TransferOutput const &, TransferOutput const &) = default;
};

struct MintOutput
{
    OutputOwners owners{};

    friend bool operator==(MintOutput const &, MintOutput const &) = default;
};

struct TransferInput
{
    uint64_t amount{};
    std::vector<uint32_t> signature_indices{};

    friend bool
    operator==(TransferInput const &, TransferInput const &) = default;
};

struct UtxoId
{
    bytes32_t tx_id{};
    uint32_t output_index{};

    friend bool operator==(UtxoId const &, UtxoId const &) = default;
};

struct TransferableOutput
{
    bytes32_t asset_id{};
    TransferOutput output{};

    friend bool
    operator==(TransferableOutput const &, TransferableOutput const &) = default;
};

struct TransferableInput
{
    UtxoId utxo_id{};
    bytes32_t asset_id{};
    TransferInput input{};

    friend bool
    operator==(TransferableInput const &, TransferableInput const &) = default;
};

/// Fields common to every transaction that moves funds: the network and chain
/// it is bound to, the fee-paying inputs, the change outputs and a free memo
struct BaseTx
{
    uint32_t network_id{};
    bytes32_t blockchain_id{};
    std::vector<TransferableOutput> outputs{};
    std::vector<TransferableInput> inputs{};
    byte_string memo{};

    friend bool operator==(BaseTx const &, BaseTx const &) = default;
};

/// Indices into the control keys of a subnet; each index requires one
/// signature in the trailing credential of the transaction
template <typename T>
concept HasBaseTx = requires(T const &tx) {
    { tx.base } -> std::convertible_to<BaseTx const &>;
};

struct SubnetAuth
{
    std::vector<uint32_t> signature_indices{};

    friend bool operator==(SubnetAuth const &, SubnetAuth const &) = default;
};

struct Validator
{
    Address node_id{};
    uint64_t start_time{};
    uint64_t end_time{};
    uint64_t weight{};

    friend bool operator==(Validator const &, Validator const &) = default;
};

struct ProofOfPossession
{
    byte_string_fixed<48> public_key{};
    byte_string_fixed<96> signature{};

    friend bool
    operator==(ProofOfPossession const &, ProofOfPossession const &) = default;
};

COSIGN_NAMESPACE_END
