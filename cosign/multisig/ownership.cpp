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

#include <cosign/core/bytes.hpp>
#include <cosign/core/fmt/bytes_fmt.hpp> // NOLINT
#include <cosign/core/result.hpp>
#include <cosign/multisig/ownership.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstddef>

COSIGN_NAMESPACE_BEGIN

OwnershipCache::OwnershipCache(OwnershipResolver &resolver)
    : resolver_{resolver}
{
}

Result<Ownership> OwnershipCache::get(bytes32_t const &subnet_id)
{
    if (auto const it = entries_.find(subnet_id); it != entries_.end()) {
        return it->second;
    }

    auto ownership = resolver_.resolve(subnet_id);
    if (ownership.has_error()) {
        LOG_WARNING(
            "ownership of subnet {} could not be resolved: {}",
            subnet_id,
            ownership.error().message().c_str());
        return ownership;
    }
    LOG_DEBUG(
        "subnet {} has {} control keys, threshold {}",
        subnet_id,
        ownership.value().control_keys.size(),
        ownership.value().threshold);
    entries_.emplace(subnet_id, ownership.value());
    return ownership;
}

bool OwnershipCache::contains(bytes32_t const &subnet_id) const
{
    return entries_.contains(subnet_id);
}

void OwnershipCache::invalidate(bytes32_t const &subnet_id)
{
    entries_.erase(subnet_id);
}

void OwnershipCache::clear()
{
    entries_.clear();
}

size_t OwnershipCache::size() const
{
    return entries_.size();
}

COSIGN_NAMESPACE_END
