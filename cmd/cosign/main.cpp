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

#include <cosign/chain/detect_chain.hpp>
#include <cosign/chain/network.hpp>
#include <cosign/core/address.hpp>
#include <cosign/core/byte_string.hpp>
#include <cosign/core/bytes.hpp>
#include <cosign/core/fmt/address_fmt.hpp> // NOLINT
#include <cosign/core/fmt/bytes_fmt.hpp> // NOLINT
#include <cosign/core/log_level_map.hpp>
#include <cosign/core/result.hpp>
#include <cosign/multisig/coordinator.hpp>
#include <cosign/multisig/ownership.hpp>

#include <CLI/CLI.hpp>
#include <evmc/hex.hpp>
#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/bundled/fmt/core.h>
#include <quill/bundled/fmt/format.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

using namespace cosign;

COSIGN_ANONYMOUS_NAMESPACE_BEGIN

/// Ownership given on the command line, the same for every subnet
struct FixedOwnershipResolver : OwnershipResolver
{
    Ownership ownership;

    explicit FixedOwnershipResolver(Ownership o)
        : ownership{std::move(o)}
    {
    }

    Result<Ownership> resolve(bytes32_t const &) override
    {
        return ownership;
    }
};

int run_detect(std::string const &hex)
{
    auto const bytes = evmc::from_hex(hex);
    if (!bytes.has_value()) {
        LOG_ERROR("input is not valid hex");
        return EXIT_FAILURE;
    }
    auto const tag = detect_chain(*bytes);
    auto const network_id = extract_network_id(*bytes);
    fmt::print(
        "chain: {}\nnetwork id: {}\nhrp: {}\n",
        chain_tag_name(tag),
        network_id,
        hrp_from_network_id(network_id));
    return tag == ChainTag::Undefined ? EXIT_FAILURE : EXIT_SUCCESS;
}

int run_inspect(
    std::filesystem::path const &path, std::vector<std::string> const &keys,
    uint32_t const threshold)
{
    Ownership ownership{.threshold = threshold};
    for (auto const &key : keys) {
        auto const address = evmc::from_hex<Address>(key);
        if (!address.has_value()) {
            LOG_ERROR("control key {} is not a 20 byte hex address", key);
            return EXIT_FAILURE;
        }
        ownership.control_keys.push_back(*address);
    }
    FixedOwnershipResolver resolver{std::move(ownership)};
    OwnershipCache cache{resolver};

    auto coordinator = MultisigCoordinator::from_file(path, cache);
    if (coordinator.has_error()) {
        LOG_ERROR(
            "cannot load {}: {}",
            path.string(),
            coordinator.error().message().c_str());
        return EXIT_FAILURE;
    }
    auto &tx = coordinator.value();
    fmt::print(
        "kind: {}\ntx id: {}\nnetwork id: {} ({})\n",
        tx.kind_name(),
        tx.tx_id(),
        tx.network_id(),
        network_kind_name(tx.network().kind));
    if (auto const subnet = tx.subnet_id(); subnet.has_value()) {
        fmt::print("subnet id: {}\n", *subnet);
    }

    if (keys.empty()) {
        auto const ready = tx.is_ready_to_commit();
        if (ready.has_value()) {
            fmt::print("ready to commit: {}\n", ready.value());
        }
        return EXIT_SUCCESS;
    }

    auto const remaining = tx.get_remaining_auth_signers();
    if (remaining.has_error()) {
        LOG_ERROR(
            "cannot list signers: {}", remaining.error().message().c_str());
        return EXIT_FAILURE;
    }
    for (auto const &signer : remaining.value().required) {
        fmt::print("required signer: {}\n", signer);
    }
    for (auto const &signer : remaining.value().missing) {
        fmt::print("missing signer: {}\n", signer);
    }
    fmt::print("ready to commit: {}\n", remaining.value().missing.empty());
    return EXIT_SUCCESS;
}

COSIGN_ANONYMOUS_NAMESPACE_END

int main(int const argc, char const *argv[])
{
    CLI::App cli{"cosign"};
    cli.option_defaults()->always_capture_default();
    cli.require_subcommand(1);

    auto log_level = quill::LogLevel::Warning;
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    std::string hex;
    auto *const detect =
        cli.add_subcommand("detect", "classify an unsigned transaction");
    detect->add_option("hex", hex, "hex encoded transaction bytes")
        ->required();

    std::filesystem::path path;
    std::vector<std::string> control_keys;
    uint32_t threshold = 1;
    auto *const inspect = cli.add_subcommand(
        "inspect", "show the signing state of an exchanged transaction");
    inspect->add_option("file", path, "exchange file")
        ->required()
        ->check(CLI::ExistingFile);
    inspect->add_option(
        "--control_key", control_keys, "control keys of the subnet, in order");
    inspect->add_option("--threshold", threshold, "signatures required");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) %(file_name):%(line_number) LOG_%(log_level)\t%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    int result = EXIT_SUCCESS;
    if (detect->parsed()) {
        result = run_detect(hex);
    }
    else if (inspect->parsed()) {
        result = run_inspect(path, control_keys, threshold);
    }
    quill::flush();
    return result;
}
