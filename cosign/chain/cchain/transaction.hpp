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
#include <cosign/core/bytes.hpp>

#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

COSIGN_CCHAIN_NAMESPACE_BEGIN

/// Credit of an imported amount to an account
struct EvmOutput
{
    Address address{};
    uint64_t amount{};
    bytes32_t asset_id{};

    friend bool operator==(EvmOutput const &, EvmOutput const &) = default;
};

/// Debit of an exported amount from an account
struct EvmInput
{
    Address address{};
    uint64_t amount{};
    bytes32_t asset_id{};
    uint64_t nonce{};

    friend bool operator==(EvmInput const &, EvmInput const &) = default;
};

struct ImportTx
{
    static constexpr uint32_t type_id = 0;
    static constexpr std::string_view name = "ImportTx";

    uint32_t network_id{};
    bytes32_t blockchain_id{};
    bytes32_t source_chain{};
    std::vector<TransferableInput> imported_inputs{};
    std::vector<EvmOutput> outputs{};

    friend bool operator==(ImportTx const &, ImportTx const &) = default;
};

struct ExportTx
{
    static constexpr uint32_t type_id = 1;
    static constexpr std::string_view name = "ExportTx";

    uint32_t network_id{};
    bytes32_t blockchain_id{};
    bytes32_t destination_chain{};
    std::vector<EvmInput> inputs{};
    std::vector<TransferableOutput> exported_outputs{};

    friend bool operator==(ExportTx const &, ExportTx const &) = default;
};

using UnsignedTransaction = std::variant<ImportTx, ExportTx>;

COSIGN_CCHAIN_NAMESPACE_END
