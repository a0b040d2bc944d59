/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "application/impl/app_configuration_impl.hpp"
#include "crypto/sha/sha256.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace singleton;
using namespace std::chrono_literals;

using application::AppConfigurationImpl;

namespace {
  constexpr auto kPublicHex =
      "d43593c715fdd31c61141abd04a99fd6822c8558854ccde39a5684e7a56da27d";
  constexpr auto kSeedHex =
      "e5be9a5092b81bca64be81d212e7f2f9eba183bb7a90954f7b76361f6edb5c0a";
}  // namespace

class AppConfigurationTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  template <size_t N>
  bool parse(const char *(&args)[N]) {
    return config_.initializeFromArgs(N, args);
  }

 protected:
  AppConfigurationImpl config_;
};

/**
 * @given --dev only
 * @when arguments are parsed
 * @then seeds of both authorities are derived from the well-known phrases and
 * the node runs the finality gadget as validator with default timings
 */
TEST_F(AppConfigurationTest, DevConfiguration) {
  const char *args[] = {"singleton_node", "--dev"};
  ASSERT_TRUE(parse(args));

  auto alice = crypto::sha256(AppConfigurationImpl::kDevBlockAuthorityPhrase);
  auto bob = crypto::sha256(AppConfigurationImpl::kDevFinalityAuthorityPhrase);
  ASSERT_TRUE(config_.blockAuthoritySeed());
  ASSERT_TRUE(config_.finalityAuthoritySeed());
  EXPECT_TRUE(std::equal(alice.begin(),
                         alice.end(),
                         config_.blockAuthoritySeed()->begin(),
                         config_.blockAuthoritySeed()->end()));
  EXPECT_TRUE(std::equal(bob.begin(),
                         bob.end(),
                         config_.finalityAuthoritySeed()->begin(),
                         config_.finalityAuthoritySeed()->end()));
  EXPECT_FALSE(config_.blockAuthority());
  EXPECT_FALSE(config_.finalityAuthority());

  EXPECT_TRUE(config_.finalityGadget());
  EXPECT_TRUE(config_.finalityGadgetValidator());
  EXPECT_EQ(config_.nodesCount(), 1);
  EXPECT_EQ(config_.authoringConfig().interval, 3000ms);
  EXPECT_EQ(config_.authoringConfig().proposal_time_budget, 2000ms);
  EXPECT_FALSE(config_.authoringConfig().skip_while_syncing);
  EXPECT_TRUE(config_.log().empty());
}

/**
 * @given public keys of both authorities, one with the 0x prefix
 * @when arguments are parsed
 * @then both keys are read and the node runs without keys of its own
 */
TEST_F(AppConfigurationTest, ObserverConfiguration) {
  auto prefixed = std::string("0x") + kPublicHex;
  const char *args[] = {"singleton_node",
                        "--block-authority",
                        kPublicHex,
                        "--finality-authority",
                        prefixed.c_str(),
                        "--finality-gadget"};
  ASSERT_TRUE(parse(args));

  ASSERT_TRUE(config_.blockAuthority());
  ASSERT_TRUE(config_.finalityAuthority());
  EXPECT_EQ(config_.blockAuthority()->toHex(), kPublicHex);
  EXPECT_EQ(config_.finalityAuthority()->toHex(), kPublicHex);
  EXPECT_FALSE(config_.blockAuthoritySeed());
  EXPECT_FALSE(config_.finalityAuthoritySeed());
  EXPECT_TRUE(config_.finalityGadget());
  EXPECT_FALSE(config_.finalityGadgetValidator());
}

/**
 * @given explicit seeds, timings, nodes count, the syncing flag and log
 * filters
 * @when arguments are parsed
 * @then all of them are taken over
 */
TEST_F(AppConfigurationTest, ExplicitOptions) {
  const char *args[] = {"singleton_node",
                        "--block-authority-seed",
                        kSeedHex,
                        "--finality-authority-seed",
                        kSeedHex,
                        "--authoring-interval",
                        "500",
                        "--proposal-time-budget",
                        "500",
                        "--nodes",
                        "64",
                        "--skip-authoring-while-syncing",
                        "-lconsensus=debug",
                        "-lgossip=trace"};
  ASSERT_TRUE(parse(args));

  ASSERT_TRUE(config_.blockAuthoritySeed());
  EXPECT_EQ(config_.blockAuthoritySeed()->toHex(), kSeedHex);
  EXPECT_EQ(config_.nodesCount(), 64);
  EXPECT_EQ(config_.authoringConfig().interval, 500ms);
  EXPECT_EQ(config_.authoringConfig().proposal_time_budget, 500ms);
  EXPECT_TRUE(config_.authoringConfig().skip_while_syncing);
  EXPECT_EQ(config_.log(),
            (std::vector<std::string>{"consensus=debug", "gossip=trace"}));
}

/**
 * @given validator flag without the finality gadget
 * @when arguments are parsed
 * @then the configuration is rejected
 */
TEST_F(AppConfigurationTest, ValidatorRequiresGadget) {
  const char *args[] = {"singleton_node",
                        "--block-authority-seed",
                        kSeedHex,
                        "--finality-authority-seed",
                        kSeedHex,
                        "--finality-gadget-validator"};
  EXPECT_FALSE(parse(args));
}

/**
 * @given validator without the seed of the finality authority
 * @when arguments are parsed
 * @then the configuration is rejected
 */
TEST_F(AppConfigurationTest, ValidatorRequiresFinalitySeed) {
  const char *args[] = {"singleton_node",
                        "--block-authority-seed",
                        kSeedHex,
                        "--finality-authority",
                        kPublicHex,
                        "--finality-gadget",
                        "--finality-gadget-validator"};
  EXPECT_FALSE(parse(args));
}

/**
 * @given one of the authorities is neither given nor derivable
 * @when arguments are parsed
 * @then the configuration is rejected
 */
TEST_F(AppConfigurationTest, RequiresBothAuthorities) {
  const char *no_finality[] = {
      "singleton_node", "--block-authority", kPublicHex};
  EXPECT_FALSE(parse(no_finality));

  const char *no_block[] = {
      "singleton_node", "--finality-authority-seed", kSeedHex};
  EXPECT_FALSE(parse(no_block));
}

/**
 * @given malformed hex keys
 * @when arguments are parsed
 * @then the configuration is rejected
 */
TEST_F(AppConfigurationTest, RejectsMalformedKeys) {
  const char *not_hex[] = {"singleton_node",
                           "--dev",
                           "--block-authority",
                           "not a key"};
  EXPECT_FALSE(parse(not_hex));

  const char *short_seed[] = {
      "singleton_node", "--dev", "--finality-authority-seed", "0xdeadbeef"};
  EXPECT_FALSE(parse(short_seed));
}

/**
 * @given nodes count out of [1, 64]
 * @when arguments are parsed
 * @then the configuration is rejected
 */
TEST_F(AppConfigurationTest, RejectsNodesCountOutOfRange) {
  const char *none[] = {"singleton_node", "--dev", "--nodes", "0"};
  EXPECT_FALSE(parse(none));

  const char *too_many[] = {"singleton_node", "--dev", "--nodes", "65"};
  EXPECT_FALSE(parse(too_many));
}

/**
 * @given proposal time budget exceeding the authoring interval
 * @when arguments are parsed
 * @then the configuration is rejected
 */
TEST_F(AppConfigurationTest, RejectsBudgetOverInterval) {
  const char *args[] = {"singleton_node",
                        "--dev",
                        "--authoring-interval",
                        "1000",
                        "--proposal-time-budget",
                        "1001"};
  EXPECT_FALSE(parse(args));
}

/**
 * @given unknown option
 * @when arguments are parsed
 * @then the configuration is rejected
 */
TEST_F(AppConfigurationTest, RejectsUnknownOption) {
  const char *args[] = {"singleton_node", "--dev", "--no-such-option"};
  EXPECT_FALSE(parse(args));
}
