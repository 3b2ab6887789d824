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

#include <cosign/chain/network.hpp>
#include <cosign/chain/pchain/signed_transaction.hpp>
#include <cosign/core/address.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/bytes.hpp>
#include <cosign/core/result.hpp>
#include <cosign/multisig/ownership.hpp>
#include <cosign/multisig/retry_policy.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

COSIGN_NAMESPACE_BEGIN

struct Signer;
struct Submitter;

/// `required` in authorization order, `missing` the subset whose trailing
/// slot is still empty
struct RemainingAuthSigners
{
    std::vector<Address> required{};
    std::vector<Address> missing{};
};

struct SignOptions
{
    bool check_auth_first{true};
    bool commit_if_ready{false};
    bool wait_for_acceptance{true};
};

struct SignOutcome
{
    bool ready{false};
    bool committed{false};
    std::optional<bytes32_t> tx_id{};
};

struct SubmissionFailure
{
    bytes32_t tx_id{};
    unsigned attempts{};
    bool timed_out{false};
    std::string message{};
};

/// Drives one P-chain transaction from unsigned to committed. The transaction
/// is ready to commit once every slot it needs is filled; committed is
/// terminal.
class MultisigCoordinator
{
    pchain::SignedTransaction tx_;
    OwnershipCache &cache_;
    RetryPolicy policy_;
    std::optional<Ownership> ownership_{};
    std::optional<bytes32_t> committed_tx_id_{};
    std::optional<SubmissionFailure> last_failure_{};

public:
    MultisigCoordinator(
        pchain::SignedTransaction, OwnershipCache &, RetryPolicy = {});

    static Result<MultisigCoordinator>
    from_bytes(byte_string_view, OwnershipCache &, RetryPolicy = {});

    static Result<MultisigCoordinator> from_file(
        std::filesystem::path const &, OwnershipCache &, RetryPolicy = {});

    Result<Ownership> subnet_owners();

    Result<std::vector<Address>> get_auth_signers();

    Result<RemainingAuthSigners> get_remaining_auth_signers();

    Result<bool> is_ready_to_commit();

    /// Fill every empty authorization slot the signer holds a key for. With
    /// commit_if_ready, a ready transaction is committed; a failed commit
    /// returns SubmissionTimedOut or SubmissionRejected in place of the
    /// outcome. Those errors only arise once the transaction was ready, and
    /// the signatures stay in place, with last_submission_failure() holding
    /// the tx id to poll.
    Result<SignOutcome> sign(Signer &, Submitter &, SignOptions const & = {});

    Result<bytes32_t> commit(Submitter &, bool wait_for_acceptance = true);

    /// Adopt the signatures of another copy of the same transaction
    Result<void> merge(pchain::SignedTransaction const &);

    byte_string to_bytes() const;

    Result<void> to_file(std::filesystem::path const &) const;

    bytes32_t tx_id() const;

    std::string_view kind_name() const;

    uint32_t network_id() const;

    Network network() const;

    std::optional<bytes32_t> subnet_id() const;

    std::optional<bytes32_t> blockchain_id() const;

    bool is_committed() const;

    std::optional<bytes32_t> const &committed_tx_id() const;

    std::optional<SubmissionFailure> const &last_submission_failure() const;

    pchain::SignedTransaction const &signed_transaction() const;
};

COSIGN_NAMESPACE_END
