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

#include <cosign/chain/network.hpp>
#include <cosign/chain/pchain/transaction.hpp>
#include <cosign/chain/pchain/transaction_info.hpp>
#include <cosign/core/bytes.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>
#include <variant>

COSIGN_PCHAIN_NAMESPACE_BEGIN

namespace
{
    template <HasBaseTx T>
    uint32_t network_id_of(T const &tx)
    {
        return tx.base.network_id;
    }

    uint32_t network_id_of(AdvanceTimeTx const &)
    {
        return UNKNOWN_NETWORK_ID;
    }

    uint32_t network_id_of(RewardValidatorTx const &)
    {
        return UNKNOWN_NETWORK_ID;
    }

    template <HasBaseTx T>
    std::optional<bytes32_t> blockchain_id_of(T const &tx)
    {
        return tx.base.blockchain_id;
    }

    std::optional<bytes32_t> blockchain_id_of(AdvanceTimeTx const &)
    {
        return std::nullopt;
    }

    std::optional<bytes32_t> blockchain_id_of(RewardValidatorTx const &)
    {
        return std::nullopt;
    }
}

std::string_view kind_name(UnsignedTransaction const &tx)
{
    return std::visit(
        [](auto const &t) { return std::decay_t<decltype(t)>::name; }, tx);
}

uint32_t network_id(UnsignedTransaction const &tx)
{
    return std::visit([](auto const &t) { return network_id_of(t); }, tx);
}

std::optional<bytes32_t> blockchain_id(UnsignedTransaction const &tx)
{
    return std::visit([](auto const &t) { return blockchain_id_of(t); }, tx);
}

std::optional<bytes32_t> subnet_id(UnsignedTransaction const &tx)
{
    return std::visit(
        [](auto const &t) -> std::optional<bytes32_t> {
            if constexpr (HasSubnetId<std::decay_t<decltype(t)>>) {
                return t.subnet_id;
            }
            else {
                return std::nullopt;
            }
        },
        tx);
}

std::optional<SubnetAuth> subnet_auth(UnsignedTransaction const &tx)
{
    return std::visit(
        [](auto const &t) -> std::optional<SubnetAuth> {
            if constexpr (SubnetGovernance<std::decay_t<decltype(t)>>) {
                return t.subnet_auth;
            }
            else {
                return std::nullopt;
            }
        },
        tx);
}

bool is_subnet_governance(UnsignedTransaction const &tx)
{
    return std::visit(
        [](auto const &t) {
            return SubnetGovernance<std::decay_t<decltype(t)>>;
        },
        tx);
}

std::string_view hrp(UnsignedTransaction const &tx)
{
    return hrp_from_network_id(network_id(tx));
}

COSIGN_PCHAIN_NAMESPACE_END
