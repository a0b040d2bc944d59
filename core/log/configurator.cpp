/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/configurator.hpp"

#include <boost/program_options.hpp>

namespace singleton::log {

  namespace {
    constexpr auto kNodeLogConfig = R"(
sinks:
  - name: console
    type: console
    stream: stderr
    thread: name
    color: false
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: libp2p
        level: off
      - name: singleton
        children:
          - name: application
          - name: authorship
          - name: blockchain
            children:
              - name: block_tree
          - name: consensus
            children:
              - name: verifier
              - name: block_import
              - name: import_queue
              - name: block_author
              - name: finality
          - name: network
            children:
              - name: gossip
              - name: block_announce
)";

    std::shared_ptr<soralog::Configurator> withNodeGroups(
        std::shared_ptr<soralog::Configurator> base) {
      return std::make_shared<soralog::ConfiguratorFromYAML>(
          std::move(base), std::string{kNodeLogConfig});
    }
  }  // namespace

  Configurator::Configurator(std::shared_ptr<soralog::Configurator> base)
      : ConfiguratorFromYAML(std::move(base), std::string{kNodeLogConfig}) {}

  Configurator::Configurator(std::shared_ptr<soralog::Configurator> base,
                             std::filesystem::path overrides)
      : ConfiguratorFromYAML(withNodeGroups(std::move(base)),
                             std::move(overrides)) {}

  std::optional<std::filesystem::path> Configurator::getLogConfigFile(
      int argc, const char **argv) {
    namespace po = boost::program_options;

    // `--log` is declared so it is not guessed as a prefix of `--logcfg`
    po::options_description desc;
    desc.add_options()                                 //
        ("logcfg", po::value<std::string>())           //
        ("log", po::value<std::vector<std::string>>());

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .allow_unregistered()
                  .run(),
              vm);

    if (vm.count("logcfg") == 0) {
      return std::nullopt;
    }
    return std::filesystem::path{vm["logcfg"].as<std::string>()};
  }

}  // namespace singleton::log
