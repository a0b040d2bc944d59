/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <filesystem>
#include <iostream>

#include <libp2p/common/final_action.hpp>
#include <libp2p/log/configurator.hpp>
#include <soralog/util.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "application/impl/singleton_application_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

namespace {
  namespace log = singleton::log;

  /**
   * Builds the logging system from the embedded group tree, or from the file
   * given with `--logcfg`
   * @return nullptr if the configuration is broken, the reason is printed
   */
  std::shared_ptr<soralog::LoggingSystem> makeLoggingSystem(int argc,
                                                            const char **argv) {
    auto libp2p_configurator = std::make_shared<libp2p::log::Configurator>();
    std::shared_ptr<log::Configurator> configurator;
    if (auto path = log::Configurator::getLogConfigFile(argc, argv)) {
      if (not std::filesystem::is_regular_file(*path)) {
        std::cerr << "Logging config " << *path << " is not a file\n";
        return nullptr;
      }
      configurator = std::make_shared<log::Configurator>(
          std::move(libp2p_configurator), *path);
    } else {
      configurator =
          std::make_shared<log::Configurator>(std::move(libp2p_configurator));
    }

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(configurator));
    auto r = logging_system->configure();
    if (not r.message.empty()) {
      (r.has_error ? std::cerr : std::cout) << r.message << '\n';
    }
    if (r.has_error) {
      return nullptr;
    }
    return logging_system;
  }

  int runNodes(int argc, const char **argv) {
    auto configuration =
        std::make_shared<singleton::application::AppConfigurationImpl>();
    if (not configuration->initializeFromArgs(argc, argv)) {
      return EXIT_FAILURE;
    }

    auto logger = log::createLogger("Main");
    if (auto r = log::tuneLoggingSystem(configuration->log()); not r) {
      SL_ERROR(logger, "Invalid --log filter: {}", r.error());
      return EXIT_FAILURE;
    }

    SL_INFO(logger,
            "Starting {} node(s), authoring every {} ms",
            configuration->nodesCount(),
            configuration->authoringConfig().interval.count());

    auto app = std::make_shared<singleton::application::SingletonApplicationImpl>(
        configuration);
    return app->run();
  }
}  // namespace

int main(int argc, const char **argv) {
  setvbuf(stdout, nullptr, _IOLBF, 0);
  setvbuf(stderr, nullptr, _IOLBF, 0);

  libp2p::common::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  soralog::util::setThreadName("singleton");

  auto logging_system = makeLoggingSystem(argc, argv);
  if (not logging_system) {
    return EXIT_FAILURE;
  }
  log::setLoggingSystem(logging_system);

  auto exit_code = runNodes(argc, argv);

  auto logger = log::createLogger("Main");
  SL_INFO(logger, "Singleton node stopped with code {}", exit_code);
  logger->flush();

  return exit_code;
}
