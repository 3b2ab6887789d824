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

#include <cosign/chain/config.hpp>
#include <cosign/chain/credential.hpp>
#include <cosign/chain/pchain/transaction.hpp>
#include <cosign/core/bytes.hpp>

#include <vector>

COSIGN_PCHAIN_NAMESPACE_BEGIN

/// Unsigned transaction plus one credential per signed input. Subnet
/// governance transactions carry one extra trailing credential for their
/// authorization indices.
struct SignedTransaction
{
    UnsignedTransaction unsigned_tx{};
    std::vector<Credential> credentials{};

    friend bool
    operator==(SignedTransaction const &, SignedTransaction const &) = default;
};

/// SHA-256 of the canonical signed encoding, the id the network assigns
bytes32_t tx_id(SignedTransaction const &);

COSIGN_PCHAIN_NAMESPACE_END
