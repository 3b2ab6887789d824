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

#include <cosign/chain/credential.hpp>
#include <cosign/chain/pchain/signed_transaction.hpp>
#include <cosign/chain/pchain/transaction_codec.hpp>
#include <cosign/core/likely.h>
#include <cosign/core/result.hpp>
#include <cosign/multisig/merge.hpp>
#include <cosign/multisig/merge_error.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <utility>
#include <vector>

COSIGN_NAMESPACE_BEGIN

Result<void> merge_signatures(
    pchain::SignedTransaction &into, pchain::SignedTransaction const &from)
{
    if (COSIGN_UNLIKELY(
            pchain::encode_unsigned_transaction(into.unsigned_tx) !=
            pchain::encode_unsigned_transaction(from.unsigned_tx))) {
        return MergeError::TransactionMismatch;
    }
    if (COSIGN_UNLIKELY(into.credentials.size() != from.credentials.size())) {
        return MergeError::CredentialShapeMismatch;
    }

    std::vector<Credential> merged = into.credentials;
    size_t adopted = 0;
    for (size_t i = 0; i < merged.size(); ++i) {
        auto &signatures = merged[i].signatures;
        auto const &theirs = from.credentials[i].signatures;
        if (COSIGN_UNLIKELY(signatures.size() != theirs.size())) {
            return MergeError::CredentialShapeMismatch;
        }
        for (size_t j = 0; j < signatures.size(); ++j) {
            if (is_empty(theirs[j]) || signatures[j] == theirs[j]) {
                continue;
            }
            if (COSIGN_UNLIKELY(!is_empty(signatures[j]))) {
                LOG_ERROR(
                    "credential {} slot {} carries two different signatures",
                    i,
                    j);
                return MergeError::ConflictingSignature;
            }
            signatures[j] = theirs[j];
            ++adopted;
        }
    }

    LOG_DEBUG("merged {} signatures", adopted);
    into.credentials = std::move(merged);
    return outcome::success();
}

COSIGN_NAMESPACE_END
