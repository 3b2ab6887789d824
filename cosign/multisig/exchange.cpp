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

#include <cosign/chain/pchain/signed_transaction.hpp>
#include <cosign/chain/pchain/transaction_codec.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/result.hpp>
#include <cosign/multisig/exchange.hpp>
#include <cosign/multisig/exchange_error.hpp>

#include <evmc/hex.hpp>

#include <quill/Quill.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

COSIGN_ANONYMOUS_NAMESPACE_BEGIN

std::string_view trim(std::string_view s)
{
    constexpr std::string_view whitespace = " \t\r\n";
    auto const begin = s.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto const end = s.find_last_not_of(whitespace);
    return s.substr(begin, end - begin + 1);
}

COSIGN_ANONYMOUS_NAMESPACE_END

COSIGN_NAMESPACE_BEGIN

byte_string to_bytes(pchain::SignedTransaction const &tx)
{
    return pchain::encode_signed_transaction(tx);
}

Result<pchain::SignedTransaction> from_bytes(byte_string_view const enc)
{
    return pchain::decode_signed_transaction(enc);
}

Result<void> to_file(
    pchain::SignedTransaction const &tx, std::filesystem::path const &path)
{
    std::ofstream out{path, std::ios::out | std::ios::trunc};
    if (!out) {
        LOG_ERROR("cannot open {} for writing", path.string());
        return ExchangeError::FileOpen;
    }
    out << evmc::hex(to_bytes(tx)) << '\n';
    out.flush();
    if (!out) {
        LOG_ERROR("cannot write {}", path.string());
        return ExchangeError::FileWrite;
    }
    return outcome::success();
}

Result<pchain::SignedTransaction> from_file(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (!in) {
        LOG_ERROR("cannot open {} for reading", path.string());
        return ExchangeError::FileOpen;
    }
    std::string const contents{
        std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};

    auto hex = trim(contents);
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }
    auto const bytes = evmc::from_hex(hex);
    if (!bytes.has_value()) {
        return ExchangeError::InvalidHex;
    }
    return from_bytes(*bytes);
}

COSIGN_NAMESPACE_END
