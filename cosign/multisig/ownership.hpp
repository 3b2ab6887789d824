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

#include <cosign/core/address.hpp>
#include <cosign/core/bytes.hpp>
#include <cosign/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

COSIGN_NAMESPACE_BEGIN

/// Control keys of a subnet and the number of them that must sign a
/// governance transaction
struct Ownership
{
    std::vector<Address> control_keys{};
    uint32_t threshold{};

    friend bool operator==(Ownership const &, Ownership const &) = default;
};

struct OwnershipResolver
{
    virtual ~OwnershipResolver() = default;

    /// OwnershipError::NotFound or OwnershipError::QueryFailed on failure
    virtual Result<Ownership> resolve(bytes32_t const &subnet_id) = 0;
};

/// Ownership resolved once per subnet. Entries are never changed after they
/// are inserted, only dropped by invalidate or clear.
class OwnershipCache
{
    OwnershipResolver &resolver_;
    std::unordered_map<bytes32_t, Ownership> entries_{};

public:
    explicit OwnershipCache(OwnershipResolver &);

    OwnershipCache(OwnershipCache const &) = delete;
    OwnershipCache &operator=(OwnershipCache const &) = delete;

    Result<Ownership> get(bytes32_t const &subnet_id);

    bool contains(bytes32_t const &subnet_id) const;

    void invalidate(bytes32_t const &subnet_id);

    void clear();

    size_t size() const;
};

COSIGN_NAMESPACE_END
