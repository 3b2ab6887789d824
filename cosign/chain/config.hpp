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

#define COSIGN_PCHAIN_NAMESPACE_BEGIN                                          \
    COSIGN_NAMESPACE_BEGIN namespace pchain                                    \
    {

#define COSIGN_PCHAIN_NAMESPACE_END                                            \
    }                                                                          \
    COSIGN_NAMESPACE_END

#define COSIGN_XCHAIN_NAMESPACE_BEGIN                                          \
    COSIGN_NAMESPACE_BEGIN namespace xchain                                    \
    {

#define COSIGN_XCHAIN_NAMESPACE_END                                            \
    }                                                                          \
    COSIGN_NAMESPACE_END

#define COSIGN_CCHAIN_NAMESPACE_BEGIN                                          \
    COSIGN_NAMESPACE_BEGIN namespace cchain                                    \
    {

#define COSIGN_CCHAIN_NAMESPACE_END                                            \
    }                                                                          \
    COSIGN_NAMESPACE_END
