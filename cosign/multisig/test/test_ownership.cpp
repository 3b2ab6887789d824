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

#include <cosign/chain/test/sample_transactions.hpp>
#include <cosign/multisig/ownership.hpp>
#include <cosign/multisig/ownership_error.hpp>
#include <cosign/multisig/test/multisig_fixtures.hpp>

#include <gtest/gtest.h>

using namespace cosign;
using namespace cosign::test;

TEST(OwnershipCache, ResolvesOnce)
{
    StaticResolver resolver;
    resolver.owners[SAMPLE_SUBNET_ID] = three_keys_threshold_two();
    OwnershipCache cache{resolver};

    EXPECT_FALSE(cache.contains(SAMPLE_SUBNET_ID));
    EXPECT_EQ(cache.get(SAMPLE_SUBNET_ID).value(), three_keys_threshold_two());
    EXPECT_EQ(cache.get(SAMPLE_SUBNET_ID).value(), three_keys_threshold_two());
    EXPECT_EQ(resolver.calls, 1);
    EXPECT_TRUE(cache.contains(SAMPLE_SUBNET_ID));
    EXPECT_EQ(cache.size(), 1);
}

TEST(OwnershipCache, FailuresAreNotCached)
{
    StaticResolver resolver;
    OwnershipCache cache{resolver};

    EXPECT_EQ(cache.get(SAMPLE_SUBNET_ID).error(), OwnershipError::NotFound);
    EXPECT_EQ(cache.size(), 0);

    resolver.owners[SAMPLE_SUBNET_ID] = three_keys_threshold_two();
    EXPECT_FALSE(cache.get(SAMPLE_SUBNET_ID).has_error());
    EXPECT_EQ(resolver.calls, 2);
}

TEST(OwnershipCache, InvalidateAndClear)
{
    StaticResolver resolver;
    resolver.owners[SAMPLE_SUBNET_ID] = three_keys_threshold_two();
    resolver.owners[filled_id(0x5c)] =
        Ownership{.control_keys = {KEY1}, .threshold = 1};
    OwnershipCache cache{resolver};

    EXPECT_FALSE(cache.get(SAMPLE_SUBNET_ID).has_error());
    EXPECT_FALSE(cache.get(filled_id(0x5c)).has_error());
    EXPECT_EQ(cache.size(), 2);

    // ownership changed on chain
    resolver.owners[SAMPLE_SUBNET_ID].control_keys.pop_back();
    EXPECT_EQ(cache.get(SAMPLE_SUBNET_ID).value(), three_keys_threshold_two());

    cache.invalidate(SAMPLE_SUBNET_ID);
    EXPECT_FALSE(cache.contains(SAMPLE_SUBNET_ID));
    EXPECT_EQ(cache.get(SAMPLE_SUBNET_ID).value().control_keys.size(), 2);
    EXPECT_EQ(resolver.calls, 3);

    cache.clear();
    EXPECT_EQ(cache.size(), 0);
}
