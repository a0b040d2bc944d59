/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "consensus/block_author.hpp"
#include "consensus/types/authority_id.hpp"
#include "crypto/sr25519_types.hpp"

namespace singleton::application {

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /**
     * @return public key of the block authority if given explicitly,
     * otherwise it is derived from the seed
     */
    virtual const std::optional<consensus::BlockAuthorityId> &blockAuthority()
        const = 0;

    virtual const std::optional<consensus::FinalityAuthorityId> &
    finalityAuthority() const = 0;

    /**
     * @return seed of the block authority keypair, the node authors blocks
     * only if it is given
     */
    virtual const std::optional<crypto::Sr25519Seed> &blockAuthoritySeed()
        const = 0;

    virtual const std::optional<crypto::Sr25519Seed> &finalityAuthoritySeed()
        const = 0;

    /**
     * @return true if the finality gadget has to be run
     */
    virtual bool finalityGadget() const = 0;

    /**
     * @return true if the finality gadget attests blocks
     */
    virtual bool finalityGadgetValidator() const = 0;

    /**
     * @return number of nodes run in the process
     */
    virtual uint32_t nodesCount() const = 0;

    virtual const consensus::AuthoringConfig &authoringConfig() const = 0;

    /**
     * @return logging filters in `--log` syntax
     */
    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace singleton::application
