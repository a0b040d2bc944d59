/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace singleton::log {

  /**
   * Sets up the console sink and the group tree of the node:
   *
   *   main
   *   ├── libp2p
   *   └── singleton
   *       ├── application
   *       ├── authorship
   *       ├── blockchain ── block_tree
   *       ├── consensus ─┬─ verifier, block_import, import_queue
   *       │              └─ block_author, finality
   *       └── network ── gossip, block_announce
   *
   * A YAML file given with `--logcfg` is applied on top of it.
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    explicit Configurator(std::shared_ptr<soralog::Configurator> base);

    Configurator(std::shared_ptr<soralog::Configurator> base,
                 std::filesystem::path overrides);

    static std::optional<std::filesystem::path> getLogConfigFile(
        int argc, const char **argv);
  };

}  // namespace singleton::log
