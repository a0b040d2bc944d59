/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include "log/logger.hpp"

#ifdef DECLARE_PROPERTY
#error DECLARE_PROPERTY already defined!
#endif  // DECLARE_PROPERTY
#define DECLARE_PROPERTY(T, N)                                                 \
 private:                                                                      \
  T N##_;                                                                      \
                                                                               \
 public:                                                                       \
  std::conditional<std::is_trivial<T>::value && (sizeof(T) <= sizeof(size_t)), \
                   T,                                                          \
                   const T &>::type                                            \
  N() const override {                                                         \
    return N##_;                                                               \
  }

namespace singleton::application {

  /**
   * Reads app configuration from the command line, missing options take
   * their default values
   */
  class AppConfigurationImpl final : public AppConfiguration {
   public:
    /// Seeds of `--dev` keys are hashes of these phrases
    static constexpr std::string_view kDevBlockAuthorityPhrase = "//Alice";
    static constexpr std::string_view kDevFinalityAuthorityPhrase = "//Bob";

    static constexpr uint32_t kMaxNodesCount = 64;

    AppConfigurationImpl();
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    AppConfigurationImpl(AppConfigurationImpl &&) = delete;
    AppConfigurationImpl &operator=(AppConfigurationImpl &&) = delete;

    /**
     * @return true if the configuration is complete and consistent, false if
     * it is not or if only the help was requested
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    DECLARE_PROPERTY(std::optional<consensus::BlockAuthorityId>,
                     blockAuthority);
    DECLARE_PROPERTY(std::optional<consensus::FinalityAuthorityId>,
                     finalityAuthority);
    DECLARE_PROPERTY(std::optional<crypto::Sr25519Seed>, blockAuthoritySeed);
    DECLARE_PROPERTY(std::optional<crypto::Sr25519Seed>,
                     finalityAuthoritySeed);
    DECLARE_PROPERTY(bool, finalityGadget);
    DECLARE_PROPERTY(bool, finalityGadgetValidator);
    DECLARE_PROPERTY(uint32_t, nodesCount);
    DECLARE_PROPERTY(consensus::AuthoringConfig, authoringConfig);
    DECLARE_PROPERTY(std::vector<std::string>, log);

   private:
    bool validate_config();

    log::Logger logger_;
  };

}  // namespace singleton::application

#undef DECLARE_PROPERTY
