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

#include <cosign/chain/credential.hpp>
#include <cosign/chain/pchain/signed_transaction.hpp>
#include <cosign/chain/test/sample_transactions.hpp>
#include <cosign/core/address.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/bytes.hpp>
#include <cosign/core/result.hpp>
#include <cosign/multisig/ownership.hpp>
#include <cosign/multisig/ownership_error.hpp>
#include <cosign/multisig/retry_policy.hpp>
#include <cosign/multisig/signer.hpp>
#include <cosign/multisig/submit_error.hpp>
#include <cosign/multisig/submitter.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <map>
#include <utility>
#include <vector>

namespace cosign::test
{
    inline Address const KEY0 = filled_address(0xa0);
    inline Address const KEY1 = filled_address(0xa1);
    inline Address const KEY2 = filled_address(0xa2);

    inline Signature signature_of(Address const &key, unsigned char salt = 0)
    {
        Signature sig{};
        std::copy(
            std::begin(key.bytes), std::end(key.bytes), sig.begin() + 1);
        sig[0] = 0x5f;
        sig[SIGNATURE_SIZE - 1] = salt;
        return sig;
    }

    struct StaticResolver : OwnershipResolver
    {
        std::map<bytes32_t, Ownership> owners{};
        size_t calls{0};

        Result<Ownership> resolve(bytes32_t const &subnet_id) override
        {
            ++calls;
            auto const it = owners.find(subnet_id);
            if (it == owners.end()) {
                return OwnershipError::NotFound;
            }
            return it->second;
        }
    };

    /// Holds a set of keys and signs with a deterministic fake signature
    struct KeySigner : Signer
    {
        std::vector<Address> keys{};
        std::vector<SlotRef> signed_slots{};

        explicit KeySigner(std::vector<Address> k)
            : keys{std::move(k)}
        {
        }

        bool can_sign(Address const &address) const override
        {
            return std::find(keys.begin(), keys.end(), address) != keys.end();
        }

        Result<void> sign_slot(
            pchain::SignedTransaction &tx, SlotRef const &slot) override
        {
            tx.credentials[slot.credential_index]
                .signatures[slot.signature_index] = signature_of(slot.address);
            signed_slots.push_back(slot);
            return outcome::success();
        }
    };

    /// Replays scripted results, succeeding once the script runs out
    struct ScriptedSubmitter : Submitter
    {
        std::deque<Result<void>> script{};
        std::vector<byte_string> submitted{};
        std::vector<std::chrono::milliseconds> timeouts{};
        std::vector<bool> waits{};

        Result<void> submit(
            byte_string_view const signed_tx,
            std::chrono::milliseconds const timeout,
            bool const wait_for_acceptance) override
        {
            submitted.emplace_back(signed_tx);
            timeouts.push_back(timeout);
            waits.push_back(wait_for_acceptance);
            if (script.empty()) {
                return outcome::success();
            }
            auto result = std::move(script.front());
            script.pop_front();
            return result;
        }
    };

    /// Policy whose sleeps are recorded instead of slept
    inline RetryPolicy
    recording_policy(std::vector<std::chrono::milliseconds> &sleeps)
    {
        RetryPolicy policy;
        policy.sleep = [&sleeps](std::chrono::milliseconds const d) {
            sleeps.push_back(d);
        };
        return policy;
    }

    inline Credential fee_credential()
    {
        return Credential{.signatures = {signature_of(filled_address(0x01))}};
    }

    /// CreateChainTx on SAMPLE_SUBNET_ID with a signed fee credential and an
    /// empty authorization credential sized to the indices
    inline pchain::SignedTransaction
    unsigned_create_chain(std::vector<uint32_t> auth_indices)
    {
        size_t const slots = auth_indices.size();
        return pchain::SignedTransaction{
            .unsigned_tx = sample_create_chain_tx(5, std::move(auth_indices)),
            .credentials = {
                fee_credential(),
                Credential{.signatures = std::vector<Signature>(slots)}}};
    }

    inline Ownership three_keys_threshold_two()
    {
        return Ownership{.control_keys = {KEY0, KEY1, KEY2}, .threshold = 2};
    }
}
