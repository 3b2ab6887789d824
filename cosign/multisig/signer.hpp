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

#include <cosign/chain/pchain/signed_transaction.hpp>
#include <cosign/core/address.hpp>
#include <cosign/core/result.hpp>

#include <cstddef>

COSIGN_NAMESPACE_BEGIN

/// One signature slot of a signed transaction and the control key that
/// must fill it
struct SlotRef
{
    size_t credential_index{};
    size_t signature_index{};
    Address address{};
};

struct Signer
{
    virtual ~Signer() = default;

    virtual bool can_sign(Address const &) const = 0;

    /// Fill the slot with a signature by slot.address over the transaction
    virtual Result<void>
    sign_slot(pchain::SignedTransaction &, SlotRef const &slot) = 0;
};

COSIGN_NAMESPACE_END
