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

#include <cosign/chain/cchain/transaction_codec.hpp>
#include <cosign/chain/cchain/transaction_info.hpp>
#include <cosign/chain/detect_chain.hpp>
#include <cosign/chain/network.hpp>
#include <cosign/chain/pchain/transaction_codec.hpp>
#include <cosign/chain/pchain/transaction_info.hpp>
#include <cosign/chain/xchain/transaction_codec.hpp>
#include <cosign/chain/xchain/transaction_info.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/config.hpp>

#include <quill/Quill.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

COSIGN_NAMESPACE_BEGIN

namespace
{
    std::array<ChainProbe, 3> const default_probes{
        ChainProbe{ChainTag::CChain, is_cchain_tx},
        ChainProbe{ChainTag::XChain, is_xchain_tx},
        ChainProbe{ChainTag::PChain, is_pchain_tx},
    };
}

std::string_view chain_tag_name(ChainTag const tag)
{
    switch (tag) {
    case ChainTag::CChain:
        return "C";
    case ChainTag::XChain:
        return "X";
    case ChainTag::PChain:
        return "P";
    case ChainTag::Undefined:
        break;
    }
    return "undefined";
}

bool is_pchain_tx(byte_string_view const enc)
{
    return !pchain::decode_unsigned_transaction(enc).has_error();
}

bool is_xchain_tx(byte_string_view const enc)
{
    return !xchain::decode_unsigned_transaction(enc).has_error();
}

bool is_cchain_tx(byte_string_view const enc)
{
    return !cchain::decode_unsigned_transaction(enc).has_error();
}

ChainTag
detect_chain(byte_string_view const enc, std::span<ChainProbe const> probes)
{
    size_t matches = 0;
    ChainTag detected = ChainTag::Undefined;
    for (auto const &probe : probes) {
        if (probe.decodes(enc)) {
            ++matches;
            detected = probe.tag;
        }
    }
    if (matches > 1) {
        LOG_DEBUG(
            "{} byte transaction decodes under {} chain formats",
            enc.size(),
            matches);
        return ChainTag::Undefined;
    }
    return detected;
}

ChainTag detect_chain(byte_string_view const enc)
{
    return detect_chain(enc, default_probes);
}

uint32_t extract_network_id(byte_string_view const enc)
{
    switch (detect_chain(enc)) {
    case ChainTag::PChain: {
        auto const tx = pchain::decode_unsigned_transaction(enc);
        return tx.has_value() ? pchain::network_id(tx.value())
                              : UNKNOWN_NETWORK_ID;
    }
    case ChainTag::XChain: {
        auto const tx = xchain::decode_unsigned_transaction(enc);
        return tx.has_value() ? xchain::network_id(tx.value())
                              : UNKNOWN_NETWORK_ID;
    }
    case ChainTag::CChain: {
        auto const tx = cchain::decode_unsigned_transaction(enc);
        return tx.has_value() ? cchain::network_id(tx.value())
                              : UNKNOWN_NETWORK_ID;
    }
    case ChainTag::Undefined:
        break;
    }
    return UNKNOWN_NETWORK_ID;
}

COSIGN_NAMESPACE_END
