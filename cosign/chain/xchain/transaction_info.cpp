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

#include <cosign/chain/components.hpp>
#include <cosign/chain/network.hpp>
#include <cosign/chain/xchain/transaction.hpp>
#include <cosign/chain/xchain/transaction_info.hpp>
#include <cosign/core/bytes.hpp>

#include <cstdint>
#include <string_view>
#include <type_traits>
#include <variant>

COSIGN_XCHAIN_NAMESPACE_BEGIN

namespace
{
    template <HasBaseTx T>
    BaseTx const &base_of(T const &tx)
    {
        return tx.base;
    }
}

std::string_view kind_name(UnsignedTransaction const &tx)
{
    return std::visit(
        [](auto const &t) { return std::decay_t<decltype(t)>::name; }, tx);
}

uint32_t network_id(UnsignedTransaction const &tx)
{
    return std::visit(
        [](auto const &t) { return base_of(t).network_id; }, tx);
}

bytes32_t blockchain_id(UnsignedTransaction const &tx)
{
    return std::visit(
        [](auto const &t) { return base_of(t).blockchain_id; }, tx);
}

std::string_view hrp(UnsignedTransaction const &tx)
{
    return hrp_from_network_id(network_id(tx));
}

COSIGN_XCHAIN_NAMESPACE_END
