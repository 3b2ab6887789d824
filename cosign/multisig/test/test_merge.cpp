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
#include <cosign/multisig/merge.hpp>
#include <cosign/multisig/merge_error.hpp>
#include <cosign/multisig/test/multisig_fixtures.hpp>

#include <gtest/gtest.h>

using namespace cosign;
using namespace cosign::test;

TEST(MergeSignatures, DisjointFillsMergeToUnion)
{
    auto a = unsigned_create_chain({0, 1, 2});
    auto b = a;
    a.credentials.back().signatures[0] = signature_of(KEY0);
    b.credentials.back().signatures[2] = signature_of(KEY2);
    b.credentials.back().signatures[0] = signature_of(KEY0);

    ASSERT_FALSE(merge_signatures(a, b).has_error());
    auto const &slots = a.credentials.back().signatures;
    EXPECT_EQ(slots[0], signature_of(KEY0));
    EXPECT_TRUE(is_empty(slots[1]));
    EXPECT_EQ(slots[2], signature_of(KEY2));
    EXPECT_EQ(a.credentials.front(), fee_credential());
}

TEST(MergeSignatures, ConflictLeavesTargetUntouched)
{
    auto a = unsigned_create_chain({0, 1});
    auto b = a;
    a.credentials.back().signatures[0] = signature_of(KEY0);
    b.credentials.back().signatures[0] = signature_of(KEY0, 1);
    b.credentials.back().signatures[1] = signature_of(KEY1);

    auto const before = a;
    EXPECT_EQ(merge_signatures(a, b).error(), MergeError::ConflictingSignature);
    EXPECT_EQ(a, before);
}

TEST(MergeSignatures, DifferentTransactions)
{
    auto a = unsigned_create_chain({0, 1});
    auto b = unsigned_create_chain({0, 2});
    auto const before = a;
    EXPECT_EQ(merge_signatures(a, b).error(), MergeError::TransactionMismatch);
    EXPECT_EQ(a, before);
}

TEST(MergeSignatures, DifferentCredentialShape)
{
    auto a = unsigned_create_chain({0, 1});
    auto b = a;
    b.credentials.back().signatures.pop_back();
    EXPECT_EQ(
        merge_signatures(a, b).error(), MergeError::CredentialShapeMismatch);

    auto c = a;
    c.credentials.pop_back();
    EXPECT_EQ(
        merge_signatures(a, c).error(), MergeError::CredentialShapeMismatch);
}
