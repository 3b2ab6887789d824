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

#include <chrono>
#include <functional>
#include <thread>

COSIGN_NAMESPACE_BEGIN

struct RetryPolicy
{
    unsigned max_attempts{3};
    std::chrono::milliseconds backoff{std::chrono::seconds{2}};
    std::chrono::milliseconds attempt_timeout{std::chrono::minutes{2}};

    // called only between attempts
    std::function<void(std::chrono::milliseconds)> sleep{
        [](std::chrono::milliseconds const d) { std::this_thread::sleep_for(d); }};

    std::function<std::chrono::steady_clock::time_point()> now{
        [] { return std::chrono::steady_clock::now(); }};
};

COSIGN_NAMESPACE_END
