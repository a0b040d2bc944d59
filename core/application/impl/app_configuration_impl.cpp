/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <iostream>

#include <boost/program_options.hpp>

#include "crypto/sha/sha256.hpp"

namespace {
  namespace po = boost::program_options;

  const uint32_t def_nodes_count = 1;
  const uint32_t def_authoring_interval_ms =
      singleton::consensus::kBlockAuthoringInterval.count();
  const uint32_t def_proposal_time_budget_ms =
      singleton::consensus::kProposalTimeBudget.count();

  template <typename T>
  std::optional<T> find_argument(const po::variables_map &vm,
                                 const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (not it->second.defaulted() or not it->second.empty()) {
        return it->second.as<T>();
      }
    }
    return std::nullopt;
  }

  /// Hex with or without the 0x prefix
  template <typename T>
  outcome::result<T> fromHexMaybePrefixed(std::string_view hex) {
    if (hex.starts_with("0x")) {
      return T::fromHexWithPrefix(hex);
    }
    return T::fromHex(hex);
  }

  outcome::result<singleton::crypto::Sr25519Seed> devSeed(
      std::string_view phrase) {
    return singleton::crypto::Sr25519Seed::fromSpan(
        singleton::crypto::sha256(phrase));
  }
}  // namespace

namespace singleton::application {

  AppConfigurationImpl::AppConfigurationImpl()
      : finalityGadget_{false},
        finalityGadgetValidator_{false},
        nodesCount_{def_nodes_count},
        logger_{log::createLogger("AppConfiguration", "application")} {}

  bool AppConfigurationImpl::validate_config() {
    if (finalityGadgetValidator_ and not finalityGadget_) {
      SL_ERROR(logger_,
               "--finality-gadget-validator requires --finality-gadget");
      return false;
    }
    if (finalityGadgetValidator_ and not finalityAuthoritySeed_) {
      SL_ERROR(logger_,
               "--finality-gadget-validator requires the seed of the "
               "finality authority");
      return false;
    }
    if (not blockAuthority_ and not blockAuthoritySeed_) {
      SL_ERROR(logger_,
               "Neither the block authority nor its seed is provided");
      return false;
    }
    if (not finalityAuthority_ and not finalityAuthoritySeed_) {
      SL_ERROR(logger_,
               "Neither the finality authority nor its seed is provided");
      return false;
    }
    if (nodesCount_ == 0 or nodesCount_ > kMaxNodesCount) {
      SL_ERROR(logger_,
               "Nodes count must be within [1, {}], got {}",
               kMaxNodesCount,
               nodesCount_);
      return false;
    }
    if (authoringConfig_.interval.count() == 0) {
      SL_ERROR(logger_, "Authoring interval must be positive");
      return false;
    }
    if (authoringConfig_.proposal_time_budget.count() == 0
        or authoringConfig_.proposal_time_budget > authoringConfig_.interval) {
      SL_ERROR(logger_,
               "Proposal time budget must be positive and not exceed the "
               "authoring interval, got {} ms",
               authoringConfig_.proposal_time_budget.count());
      return false;
    }
    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -llibp2p=off.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Filepath of a custom logging configuration")
        ;

    po::options_description consensus_desc("Consensus options");
    consensus_desc.add_options()
        ("block-authority", po::value<std::string>(), "public key of the block authority, hex")
        ("finality-authority", po::value<std::string>(), "public key of the finality authority, hex")
        ("block-authority-seed", po::value<std::string>(), "seed of the block authority keypair, hex; enables block authoring")
        ("finality-authority-seed", po::value<std::string>(), "seed of the finality authority keypair, hex")
        ("finality-gadget", po::bool_switch(), "run the finality gadget")
        ("finality-gadget-validator", po::bool_switch(), "attest finality of new best blocks, requires the finality authority seed")
        ("authoring-interval", po::value<uint32_t>()->default_value(def_authoring_interval_ms),
          "period of block authoring, ms")
        ("proposal-time-budget", po::value<uint32_t>()->default_value(def_proposal_time_budget_ms),
          "time a block may be built for, ms")
        ("skip-authoring-while-syncing", po::bool_switch(), "do not author blocks while the node is syncing")
        ;

    po::options_description development_desc("Additional options");
    development_desc.add_options()
        ("dev", "use well-known keys of both authorities and run the finality gadget as validator")
        ("nodes", po::value<uint32_t>()->default_value(def_nodes_count),
          "number of nodes run in process over a loopback network, the first one holds the keys")
        ;
    // clang-format on

    po::variables_map vm;
    // first-run parse to read only general options and to lookup for "help"
    // all the rest options are ignored
    po::parsed_options parsed = po::command_line_parser(argc, argv)
                                    .options(desc)
                                    .allow_unregistered()
                                    .run();
    po::store(parsed, vm);
    po::notify(vm);

    desc.add(consensus_desc).add(development_desc);

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("dev") > 0) {
      auto block_seed = devSeed(kDevBlockAuthorityPhrase);
      auto finality_seed = devSeed(kDevFinalityAuthorityPhrase);
      if (not block_seed or not finality_seed) {
        SL_ERROR(logger_, "Unable to derive development seeds");
        return false;
      }
      blockAuthoritySeed_ = block_seed.value();
      finalityAuthoritySeed_ = finality_seed.value();
      finalityGadget_ = true;
      finalityGadgetValidator_ = true;
    }

    if (auto hex = find_argument<std::string>(vm, "block-authority")) {
      auto id = fromHexMaybePrefixed<consensus::BlockAuthorityId>(*hex);
      if (not id) {
        SL_ERROR(logger_, "Invalid block authority '{}': {}", *hex, id.error());
        return false;
      }
      blockAuthority_ = id.value();
    }
    if (auto hex = find_argument<std::string>(vm, "finality-authority")) {
      auto id = fromHexMaybePrefixed<consensus::FinalityAuthorityId>(*hex);
      if (not id) {
        SL_ERROR(
            logger_, "Invalid finality authority '{}': {}", *hex, id.error());
        return false;
      }
      finalityAuthority_ = id.value();
    }
    if (auto hex = find_argument<std::string>(vm, "block-authority-seed")) {
      auto seed = fromHexMaybePrefixed<crypto::Sr25519Seed>(*hex);
      if (not seed) {
        SL_ERROR(logger_, "Invalid block authority seed: {}", seed.error());
        return false;
      }
      blockAuthoritySeed_ = seed.value();
    }
    if (auto hex = find_argument<std::string>(vm, "finality-authority-seed")) {
      auto seed = fromHexMaybePrefixed<crypto::Sr25519Seed>(*hex);
      if (not seed) {
        SL_ERROR(
            logger_, "Invalid finality authority seed: {}", seed.error());
        return false;
      }
      finalityAuthoritySeed_ = seed.value();
    }

    if (auto flag = find_argument<bool>(vm, "finality-gadget");
        flag and *flag) {
      finalityGadget_ = true;
    }
    if (auto flag = find_argument<bool>(vm, "finality-gadget-validator");
        flag and *flag) {
      finalityGadgetValidator_ = true;
    }
    if (auto flag = find_argument<bool>(vm, "skip-authoring-while-syncing");
        flag and *flag) {
      authoringConfig_.skip_while_syncing = true;
    }

    if (auto count = find_argument<uint32_t>(vm, "nodes")) {
      nodesCount_ = *count;
    }
    if (auto ms = find_argument<uint32_t>(vm, "authoring-interval")) {
      authoringConfig_.interval = std::chrono::milliseconds(*ms);
    }
    if (auto ms = find_argument<uint32_t>(vm, "proposal-time-budget")) {
      authoringConfig_.proposal_time_budget = std::chrono::milliseconds(*ms);
    }

    if (auto filters = find_argument<std::vector<std::string>>(vm, "log")) {
      log_ = std::move(*filters);
    }

    return validate_config();
  }

}  // namespace singleton::application
