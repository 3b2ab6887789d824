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

#include <cstdint>
#include <functional>
#include <span>
#include <string_view>

COSIGN_NAMESPACE_BEGIN

enum class ChainTag : uint8_t
{
    Undefined = 0,
    CChain,
    XChain,
    PChain,
};

std::string_view chain_tag_name(ChainTag);

bool is_pchain_tx(byte_string_view);
bool is_xchain_tx(byte_string_view);
bool is_cchain_tx(byte_string_view);

/// One candidate format for an unclassified blob; decodes reports whether
/// the bytes are a complete unsigned transaction of that format
struct ChainProbe
{
    ChainTag tag{ChainTag::Undefined};
    std::function<bool(byte_string_view)> decodes{};
};

/// Classify by trial decoding against every probe. Exactly one accepting
/// probe names the chain; none, or more than one, is Undefined. Every probe
/// is always run.
ChainTag detect_chain(byte_string_view, std::span<ChainProbe const>);

ChainTag detect_chain(byte_string_view);

/// Network id embedded in the transaction, 0 when the bytes cannot be
/// classified or the transaction kind carries none
uint32_t extract_network_id(byte_string_view);

COSIGN_NAMESPACE_END
