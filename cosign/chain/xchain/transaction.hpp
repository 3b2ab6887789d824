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
#include <cosign/core/bytes.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

COSIGN_XCHAIN_NAMESPACE_BEGIN

using FxOutput = std::variant<TransferOutput, MintOutput>;

struct InitialState
{
    uint32_t fx_index{};
    std::vector<FxOutput> outputs{};

    friend bool operator==(InitialState const &, InitialState const &) = default;
};

struct MintOperation
{
    std::vector<uint32_t> signature_indices{};
    MintOutput mint_output{};
    TransferOutput transfer_output{};

    friend bool
    operator==(MintOperation const &, MintOperation const &) = default;
};

struct Operation
{
    bytes32_t asset_id{};
    std::vector<UtxoId> utxo_ids{};
    MintOperation op{};

    friend bool operator==(Operation const &, Operation const &) = default;
};

struct BaseTransactionTx
{
    static constexpr uint32_t type_id = 0;
    static constexpr std::string_view name = "BaseTx";

    BaseTx base{};

    friend bool
    operator==(BaseTransactionTx const &, BaseTransactionTx const &) = default;
};

struct CreateAssetTx
{
    static constexpr uint32_t type_id = 1;
    static constexpr std::string_view name = "CreateAssetTx";

    BaseTx base{};
    std::string asset_name{};
    std::string symbol{};
    uint8_t denomination{};
    std::vector<InitialState> initial_states{};

    friend bool
    operator==(CreateAssetTx const &, CreateAssetTx const &) = default;
};

struct OperationTx
{
    static constexpr uint32_t type_id = 2;
    static constexpr std::string_view name = "OperationTx";

    BaseTx base{};
    std::vector<Operation> operations{};

    friend bool operator==(OperationTx const &, OperationTx const &) = default;
};

struct ImportTx
{
    static constexpr uint32_t type_id = 3;
    static constexpr std::string_view name = "ImportTx";

    BaseTx base{};
    bytes32_t source_chain{};
    std::vector<TransferableInput> imported_inputs{};

    friend bool operator==(ImportTx const &, ImportTx const &) = default;
};

struct ExportTx
{
    static constexpr uint32_t type_id = 4;
    static constexpr std::string_view name = "ExportTx";

    BaseTx base{};
    bytes32_t destination_chain{};
    std::vector<TransferableOutput> exported_outputs{};

    friend bool operator==(ExportTx const &, ExportTx const &) = default;
};

using UnsignedTransaction = std::variant<
    BaseTransactionTx, CreateAssetTx, OperationTx, ImportTx, ExportTx>;

COSIGN_XCHAIN_NAMESPACE_END
