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
#include <cosign/chain/network.hpp>
#include <cosign/chain/pchain/signed_transaction.hpp>
#include <cosign/chain/pchain/transaction_info.hpp>
#include <cosign/core/address.hpp>
#include <cosign/core/assert.h>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/bytes.hpp>
#include <cosign/core/fmt/address_fmt.hpp> // NOLINT
#include <cosign/core/fmt/bytes_fmt.hpp> // NOLINT
#include <cosign/core/likely.h>
#include <cosign/core/result.hpp>
#include <cosign/multisig/coordinator.hpp>
#include <cosign/multisig/exchange.hpp>
#include <cosign/multisig/merge.hpp>
#include <cosign/multisig/multisig_error.hpp>
#include <cosign/multisig/ownership.hpp>
#include <cosign/multisig/retry_policy.hpp>
#include <cosign/multisig/signer.hpp>
#include <cosign/multisig/submit_error.hpp>
#include <cosign/multisig/submitter.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

COSIGN_NAMESPACE_BEGIN

MultisigCoordinator::MultisigCoordinator(
    pchain::SignedTransaction tx, OwnershipCache &cache, RetryPolicy policy)
    : tx_{std::move(tx)}
    , cache_{cache}
    , policy_{std::move(policy)}
{
    COSIGN_ASSERT(policy_.max_attempts > 0);
    COSIGN_ASSERT(policy_.sleep && policy_.now);
}

Result<MultisigCoordinator> MultisigCoordinator::from_bytes(
    byte_string_view const enc, OwnershipCache &cache, RetryPolicy policy)
{
    BOOST_OUTCOME_TRY(auto tx, COSIGN_NAMESPACE::from_bytes(enc));
    return MultisigCoordinator{std::move(tx), cache, std::move(policy)};
}

Result<MultisigCoordinator> MultisigCoordinator::from_file(
    std::filesystem::path const &path, OwnershipCache &cache,
    RetryPolicy policy)
{
    BOOST_OUTCOME_TRY(auto tx, COSIGN_NAMESPACE::from_file(path));
    return MultisigCoordinator{std::move(tx), cache, std::move(policy)};
}

Result<Ownership> MultisigCoordinator::subnet_owners()
{
    if (!ownership_.has_value()) {
        auto const subnet = pchain::subnet_id(tx_.unsigned_tx);
        if (!subnet.has_value()) {
            return MultisigError::UnsupportedTxKind;
        }
        BOOST_OUTCOME_TRY(auto ownership, cache_.get(*subnet));
        ownership_ = std::move(ownership);
    }
    return *ownership_;
}

Result<std::vector<Address>> MultisigCoordinator::get_auth_signers()
{
    auto const auth = pchain::subnet_auth(tx_.unsigned_tx);
    if (!auth.has_value()) {
        return MultisigError::UnsupportedTxKind;
    }
    BOOST_OUTCOME_TRY(auto const owners, subnet_owners());

    std::vector<Address> signers;
    signers.reserve(auth->signature_indices.size());
    for (auto const index : auth->signature_indices) {
        if (COSIGN_UNLIKELY(index >= owners.control_keys.size())) {
            LOG_ERROR(
                "transaction {} references control key {} of {}",
                tx_id(),
                index,
                owners.control_keys.size());
            return MultisigError::CorruptTransaction;
        }
        signers.push_back(owners.control_keys[index]);
    }
    return signers;
}

Result<RemainingAuthSigners> MultisigCoordinator::get_remaining_auth_signers()
{
    if (!pchain::is_subnet_governance(tx_.unsigned_tx)) {
        return MultisigError::UnsupportedTxKind;
    }
    // at least one fee input plus the authorization credential
    if (COSIGN_UNLIKELY(tx_.credentials.size() < 2)) {
        return MultisigError::MalformedTransaction;
    }
    auto const fee_credentials = std::span{tx_.credentials}.first(
        tx_.credentials.size() - 1);
    if (COSIGN_UNLIKELY(!std::ranges::all_of(
            fee_credentials, [](Credential const &cred) {
                return is_fully_signed(cred);
            }))) {
        return MultisigError::MalformedTransaction;
    }

    BOOST_OUTCOME_TRY(auto required, get_auth_signers());

    auto const &trailing = tx_.credentials.back().signatures;
    if (COSIGN_UNLIKELY(trailing.size() != required.size())) {
        return MultisigError::CorruptTransaction;
    }

    RemainingAuthSigners remaining{.required = std::move(required)};
    for (size_t i = 0; i < trailing.size(); ++i) {
        if (is_empty(trailing[i])) {
            remaining.missing.push_back(remaining.required[i]);
        }
    }
    return remaining;
}

Result<bool> MultisigCoordinator::is_ready_to_commit()
{
    if (pchain::is_subnet_governance(tx_.unsigned_tx)) {
        BOOST_OUTCOME_TRY(auto const remaining, get_remaining_auth_signers());
        return remaining.missing.empty();
    }
    return std::ranges::all_of(tx_.credentials, [](Credential const &cred) {
        return is_fully_signed(cred);
    });
}

Result<SignOutcome> MultisigCoordinator::sign(
    Signer &signer, Submitter &submitter, SignOptions const &options)
{
    BOOST_OUTCOME_TRY(auto const remaining, get_remaining_auth_signers());

    if (options.check_auth_first &&
        std::ranges::none_of(remaining.missing, [&](Address const &key) {
            return signer.can_sign(key);
        })) {
        LOG_INFO(
            "signer holds none of the {} missing keys of transaction {}",
            remaining.missing.size(),
            tx_id());
        return MultisigError::NoUsableSigner;
    }

    size_t const credential_index = tx_.credentials.size() - 1;
    size_t filled = 0;
    for (size_t i = 0; i < remaining.required.size(); ++i) {
        if (!is_empty(tx_.credentials[credential_index].signatures[i])) {
            continue;
        }
        Address const &key = remaining.required[i];
        if (!signer.can_sign(key)) {
            continue;
        }
        BOOST_OUTCOME_TRY(signer.sign_slot(
            tx_,
            SlotRef{
                .credential_index = credential_index,
                .signature_index = i,
                .address = key}));
        LOG_DEBUG("signed slot {} for {}", i, key);
        ++filled;
    }

    BOOST_OUTCOME_TRY(auto const ready, is_ready_to_commit());
    LOG_DEBUG(
        "filled {} slots of transaction {}, ready to commit: {}",
        filled,
        tx_id(),
        ready);

    SignOutcome outcome{.ready = ready};
    if (ready && options.commit_if_ready) {
        BOOST_OUTCOME_TRY(
            auto const id, commit(submitter, options.wait_for_acceptance));
        outcome.committed = true;
        outcome.tx_id = id;
    }
    return outcome;
}

Result<bytes32_t>
MultisigCoordinator::commit(Submitter &submitter, bool const wait_for_acceptance)
{
    BOOST_OUTCOME_TRY(auto const ready, is_ready_to_commit());
    if (!ready) {
        return MultisigError::NotFullySigned;
    }

    auto const id = tx_id();
    auto const encoded = to_bytes();
    bool timed_out = false;
    std::string message;
    for (unsigned attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        if (attempt > 1) {
            policy_.sleep(policy_.backoff);
        }
        auto const deadline = policy_.now() + policy_.attempt_timeout;
        LOG_INFO(
            "submitting transaction {}, attempt {} of {}",
            id,
            attempt,
            policy_.max_attempts);
        auto const result = submitter.submit(
            encoded, policy_.attempt_timeout, wait_for_acceptance);
        if (result.has_value()) {
            LOG_INFO("transaction {} committed", id);
            committed_tx_id_ = id;
            last_failure_.reset();
            return id;
        }
        timed_out = result.error() == SubmitError::Timeout ||
                    policy_.now() >= deadline;
        message = result.error().message().c_str();
        if (timed_out) {
            LOG_WARNING(
                "transaction {} attempt {} timed out: {}",
                id,
                attempt,
                message);
        }
        else {
            LOG_WARNING(
                "transaction {} attempt {} rejected: {}", id, attempt, message);
        }
    }

    LOG_ERROR(
        "transaction {} not committed after {} attempts",
        id,
        policy_.max_attempts);
    last_failure_ = SubmissionFailure{
        .tx_id = id,
        .attempts = policy_.max_attempts,
        .timed_out = timed_out,
        .message = std::move(message)};
    if (timed_out) {
        return MultisigError::SubmissionTimedOut;
    }
    return MultisigError::SubmissionRejected;
}

Result<void> MultisigCoordinator::merge(pchain::SignedTransaction const &other)
{
    return merge_signatures(tx_, other);
}

byte_string MultisigCoordinator::to_bytes() const
{
    return COSIGN_NAMESPACE::to_bytes(tx_);
}

Result<void>
MultisigCoordinator::to_file(std::filesystem::path const &path) const
{
    return COSIGN_NAMESPACE::to_file(tx_, path);
}

bytes32_t MultisigCoordinator::tx_id() const
{
    return pchain::tx_id(tx_);
}

std::string_view MultisigCoordinator::kind_name() const
{
    return pchain::kind_name(tx_.unsigned_tx);
}

uint32_t MultisigCoordinator::network_id() const
{
    return pchain::network_id(tx_.unsigned_tx);
}

Network MultisigCoordinator::network() const
{
    return network_from_network_id(network_id());
}

std::optional<bytes32_t> MultisigCoordinator::subnet_id() const
{
    return pchain::subnet_id(tx_.unsigned_tx);
}

std::optional<bytes32_t> MultisigCoordinator::blockchain_id() const
{
    return pchain::blockchain_id(tx_.unsigned_tx);
}

bool MultisigCoordinator::is_committed() const
{
    return committed_tx_id_.has_value();
}

std::optional<bytes32_t> const &MultisigCoordinator::committed_tx_id() const
{
    return committed_tx_id_;
}

std::optional<SubmissionFailure> const &
MultisigCoordinator::last_submission_failure() const
{
    return last_failure_;
}

pchain::SignedTransaction const &
MultisigCoordinator::signed_transaction() const
{
    return tx_;
}

COSIGN_NAMESPACE_END
