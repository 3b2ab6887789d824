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

#include <cosign/core/byte_string.hpp>
#include <cosign/core/result.hpp>

#include <chrono>

COSIGN_NAMESPACE_BEGIN

struct Submitter
{
    virtual ~Submitter() = default;

    /// Submit a fully signed transaction; when wait_for_acceptance is set,
    /// return only once the network has accepted it. Fails with
    /// SubmitError::Timeout, Rejected or Unreachable.
    virtual Result<void> submit(
        byte_string_view signed_tx, std::chrono::milliseconds timeout,
        bool wait_for_acceptance) = 0;
};

COSIGN_NAMESPACE_END
