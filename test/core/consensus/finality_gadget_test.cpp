/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/impl/finality_gadget_impl.hpp"

#include <gtest/gtest.h>

#include "blockchain/impl/in_memory_block_tree.hpp"
#include "consensus/constants.hpp"
#include "consensus/seal_codec.hpp"
#include "consensus/sealing.hpp"
#include "consensus/types/finality_message.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "crypto/sr25519/sr25519_provider_impl.hpp"
#include "mock/core/blockchain/block_tree_mock.hpp"
#include "mock/core/network/gossip_transport_mock.hpp"
#include "network/impl/accept_all_validator.hpp"
#include "network/impl/loopback_gossip_hub.hpp"
#include "network/types/gossip_message.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/sr25519_utils.hpp"

using namespace singleton;
using namespace consensus;

using blockchain::BlockTreeMock;
using blockchain::InMemoryBlockTree;
using network::GossipMessage;
using network::GossipTransportMock;
using network::TopicNotification;
using primitives::BlockHash;
using primitives::BlockInfo;
using primitives::events::ChainSubscriptionEngine;
using testing::_;
using testing::Return;
using testing::SaveArg;
using testing::StrictMock;

namespace {
  common::Buffer makeEnvelope(const FinalityMessage &message,
                              primitives::ConsensusEngineId engine_id =
                                  kEngineId,
                              std::string protocol_name =
                                  std::string(kFinalityProtocolName)) {
    GossipMessage envelope{
        .engine_id = engine_id,
        .protocol_name = std::move(protocol_name),
        .body = common::Buffer(::scale::encode(message).value()),
    };
    return common::Buffer(::scale::encode(envelope).value());
  }
}  // namespace

class FinalityGadgetTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  std::shared_ptr<FinalityGadgetImpl> makeGadget(
      std::optional<crypto::Sr25519Keypair> keypair) {
    return std::make_shared<FinalityGadgetImpl>(
        io_context_,
        FinalityAuthority{FinalityAuthorityId{keypair_.public_key},
                          sr25519_provider_},
        std::move(keypair),
        block_tree_,
        chain_events_engine_,
        transport_,
        std::make_shared<network::AcceptAllValidator>(),
        sr25519_provider_,
        hasher_);
  }

  FinalityMessage attest(const BlockHash &hash,
                         const crypto::Sr25519Keypair &keypair) const {
    return FinalityMessage{
        .block_hash = hash,
        .justification =
            signJustification(hash, keypair, *sr25519_provider_).value(),
    };
  }

 protected:
  std::shared_ptr<boost::asio::io_context> io_context_ =
      std::make_shared<boost::asio::io_context>();
  std::shared_ptr<crypto::Hasher> hasher_ =
      std::make_shared<crypto::HasherImpl>();
  std::shared_ptr<crypto::Sr25519Provider> sr25519_provider_ =
      std::make_shared<crypto::Sr25519ProviderImpl>();
  primitives::events::ChainSubscriptionEnginePtr chain_events_engine_ =
      std::make_shared<ChainSubscriptionEngine>();

  crypto::Sr25519Keypair keypair_ = generateSr25519Keypair(0xb0);

  std::shared_ptr<StrictMock<BlockTreeMock>> block_tree_ =
      std::make_shared<StrictMock<BlockTreeMock>>();
  std::shared_ptr<StrictMock<GossipTransportMock>> transport_ =
      std::make_shared<StrictMock<GossipTransportMock>>();

  BlockInfo block_{3, "block"_hash256};
};

/**
 * @given finality message signed by the finality authority
 * @when it arrives over gossip
 * @then the block is finalized with the carried justification
 */
TEST_F(FinalityGadgetTest, AppliesValidAttestation) {
  auto gadget = makeGadget(std::nullopt);
  auto message = attest(block_.hash, keypair_);

  EXPECT_CALL(*block_tree_,
              finalize(block_.hash, makeJustification(message.justification),
                       true))
      .WillOnce(Return(outcome::success()));

  EXPECT_OUTCOME_TRUE_1(gadget->onGossipMessage(
      TopicNotification{"peer"_peerid, makeEnvelope(message)}));
}

/**
 * @given finality message signed by another key, and one signed over
 * another block
 * @when they arrive over gossip
 * @then INVALID_SIGNATURE is returned and nothing is finalized
 */
TEST_F(FinalityGadgetTest, RejectsForgedAttestation) {
  auto gadget = makeGadget(std::nullopt);

  auto forged = attest(block_.hash, generateSr25519Keypair(0x01));
  EXPECT_EC(gadget->onGossipMessage(
                TopicNotification{"peer"_peerid, makeEnvelope(forged)}),
            FinalityMessageError::INVALID_SIGNATURE);

  auto misplaced = attest("another"_hash256, keypair_);
  misplaced.block_hash = block_.hash;
  EXPECT_EC(gadget->onGossipMessage(
                TopicNotification{"peer"_peerid, makeEnvelope(misplaced)}),
            FinalityMessageError::INVALID_SIGNATURE);
}

/**
 * @given finality messages in envelopes of another engine and protocol
 * @when they arrive over gossip
 * @then they are rejected without touching the ledger
 */
TEST_F(FinalityGadgetTest, RejectsForeignEnvelope) {
  auto gadget = makeGadget(std::nullopt);
  auto message = attest(block_.hash, keypair_);

  primitives::ConsensusEngineId frnk(
      std::array<uint8_t, 4>{'F', 'R', 'N', 'K'});
  auto foreign_engine = makeEnvelope(message, frnk);
  EXPECT_EC(gadget->onGossipMessage(
                TopicNotification{"peer"_peerid, foreign_engine}),
            FinalityMessageError::WRONG_ENGINE);

  auto foreign_protocol =
      makeEnvelope(message, kEngineId, "/paritytech/grandpa/1");
  EXPECT_EC(gadget->onGossipMessage(
                TopicNotification{"peer"_peerid, foreign_protocol}),
            FinalityMessageError::UNKNOWN_PROTOCOL);

  EXPECT_OUTCOME_FALSE_1(gadget->onGossipMessage(
      TopicNotification{"peer"_peerid, common::Buffer{1, 2, 3}}));
}

/**
 * @given gadget holding the finality authority key
 * @when a new best block is reported
 * @then the attestation is flooded on the finality topic and the block is
 * finalized locally
 */
TEST_F(FinalityGadgetTest, AttestsNewBestBlock) {
  auto gadget = makeGadget(keypair_);

  common::Buffer flooded;
  EXPECT_CALL(*transport_, flood(gadget->topic(), _, false))
      .WillOnce(testing::SaveArg<1>(&flooded));
  EXPECT_CALL(*block_tree_, finalize(block_.hash, _, true))
      .WillOnce(Return(outcome::success()));

  EXPECT_OUTCOME_TRUE_1(gadget->onNewBestBlock(block_));

  EXPECT_OUTCOME_TRUE(envelope, ::scale::decode<GossipMessage>(flooded));
  EXPECT_EQ(envelope.engine_id, kEngineId);
  EXPECT_EQ(envelope.protocol_name, kFinalityProtocolName);
  EXPECT_OUTCOME_TRUE(message, ::scale::decode<FinalityMessage>(envelope.body));
  EXPECT_EQ(message.block_hash, block_.hash);
  EXPECT_OUTCOME_TRUE(valid,
                      sr25519_provider_->verify(message.justification.signature,
                                                block_.hash,
                                                keypair_.public_key));
  EXPECT_TRUE(valid);
}

/**
 * @given gadget
 * @when it is started and stopped
 * @then the validator and the handler are registered on the finality topic
 * and the transport is driven along
 */
TEST_F(FinalityGadgetTest, DrivesTransport) {
  auto gadget = makeGadget(std::nullopt);

  EXPECT_CALL(*transport_, setValidator(gadget->topic(), _));
  EXPECT_CALL(*transport_, subscribe(gadget->topic(), _));
  EXPECT_CALL(*transport_, start());
  gadget->start();
  gadget->start();

  EXPECT_CALL(*transport_, stop());
  gadget->stop();
  gadget->stop();

  EXPECT_EQ(gadget->topic(),
            hasher_->sha2_256(common::Buffer::fromString(kFinalityTopic)));
}

/**
 * @given gadget started, stopped and started again
 * @when an attestation arrives over the transport
 * @then the handler was registered once and the block is finalized once
 */
TEST_F(FinalityGadgetTest, RestartKeepsSingleHandler) {
  auto gadget = makeGadget(std::nullopt);
  auto message = attest(block_.hash, keypair_);

  network::GossipTransport::Handler handler;
  EXPECT_CALL(*transport_, setValidator(gadget->topic(), _));
  EXPECT_CALL(*transport_, subscribe(gadget->topic(), _))
      .WillOnce(SaveArg<1>(&handler));
  EXPECT_CALL(*transport_, start()).Times(2);
  EXPECT_CALL(*transport_, stop());
  gadget->start();
  gadget->stop();

  // muted while stopped
  handler(TopicNotification{"peer"_peerid, makeEnvelope(message)});
  io_context_->poll();

  gadget->start();
  EXPECT_CALL(*block_tree_,
              finalize(block_.hash, makeJustification(message.justification),
                       true))
      .WillOnce(Return(outcome::success()));
  handler(TopicNotification{"peer"_peerid, makeEnvelope(message)});
  io_context_->restart();
  io_context_->poll();
}

/**
 * Two nodes connected by the loopback gossip network, each with a ledger of
 * its own; the first one runs the finality gadget as validator
 */
class FinalityGossipTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  struct Node {
    primitives::events::ChainSubscriptionEnginePtr events =
        std::make_shared<ChainSubscriptionEngine>();
    std::shared_ptr<InMemoryBlockTree> block_tree;
    std::shared_ptr<network::LoopbackGossipEndpoint> endpoint;
    std::shared_ptr<FinalityGadgetImpl> gadget;
  };

  void SetUp() override {
    validator_ = makeNode("validator", keypair_);
    follower_ = makeNode("follower", std::nullopt);
    validator_.gadget->start();
    follower_.gadget->start();
  }

  void TearDown() override {
    validator_.gadget->stop();
    follower_.gadget->stop();
  }

  Node makeNode(std::string_view name,
                std::optional<crypto::Sr25519Keypair> keypair) {
    Node node;
    node.block_tree = std::make_shared<InMemoryBlockTree>(
        primitives::BlockHeader{}, hasher_, node.events);
    node.endpoint = hub_->makeEndpoint(name, io_context_, hasher_).value();
    node.gadget = std::make_shared<FinalityGadgetImpl>(
        io_context_,
        FinalityAuthority{FinalityAuthorityId{keypair_.public_key},
                          sr25519_provider_},
        std::move(keypair),
        node.block_tree,
        node.events,
        node.endpoint,
        std::make_shared<network::AcceptAllValidator>(),
        sr25519_provider_,
        hasher_);
    return node;
  }

  /// Child of genesis, the same on every node
  BlockImportParams makeBlock() const {
    BlockImportParams params;
    params.header.parent_hash = validator_.block_tree->getGenesisBlockHash();
    params.header.number = 1;
    params.post_digests.emplace_back(makeSealDigest({}));
    params.fork_choice = ForkChoiceStrategy::kLongestChain;
    return params;
  }

  void runIo() {
    io_context_->restart();
    io_context_->poll();
  }

 protected:
  std::shared_ptr<boost::asio::io_context> io_context_ =
      std::make_shared<boost::asio::io_context>();
  std::shared_ptr<crypto::Hasher> hasher_ =
      std::make_shared<crypto::HasherImpl>();
  std::shared_ptr<crypto::Sr25519Provider> sr25519_provider_ =
      std::make_shared<crypto::Sr25519ProviderImpl>();
  std::shared_ptr<network::LoopbackGossipHub> hub_ =
      std::make_shared<network::LoopbackGossipHub>();

  crypto::Sr25519Keypair keypair_ = generateSr25519Keypair(0xb0);

  Node validator_;
  Node follower_;
};

/**
 * @given block known to both nodes
 * @when it becomes the best block of the validator
 * @then the validator floods its attestation and both nodes finalize the block
 */
TEST_F(FinalityGossipTest, FollowerFinalizesAttestedBlock) {
  auto params = makeBlock();
  BlockInfo block{1,
                  primitives::calculateBlockHash(params.postHeader(),
                                                 *hasher_)};

  EXPECT_OUTCOME_TRUE_1(follower_.block_tree->importBlock(params));
  runIo();
  EXPECT_EQ(follower_.block_tree->getLastFinalized().number, 0);

  EXPECT_OUTCOME_TRUE_1(validator_.block_tree->importBlock(params));
  runIo();
  runIo();

  EXPECT_EQ(validator_.block_tree->getLastFinalized(), block);
  EXPECT_EQ(follower_.block_tree->getLastFinalized(), block);

  EXPECT_OUTCOME_TRUE(justification,
                      follower_.block_tree->getBlockJustification(block.hash));
  EXPECT_OUTCOME_TRUE(decoded, decodeJustification(justification));
  EXPECT_OUTCOME_TRUE(valid,
                      sr25519_provider_->verify(
                          decoded.signature, block.hash, keypair_.public_key));
  EXPECT_TRUE(valid);
}

/**
 * @given third endpoint on the network that does not hold the finality key
 * @when it floods an attestation with a corrupted signature
 * @then the follower never finalizes the block
 */
TEST_F(FinalityGossipTest, CorruptedAttestationIsIgnored) {
  auto params = makeBlock();
  BlockInfo block{1,
                  primitives::calculateBlockHash(params.postHeader(),
                                                 *hasher_)};
  EXPECT_OUTCOME_TRUE_1(follower_.block_tree->importBlock(params));

  auto justification =
      signJustification(block.hash, keypair_, *sr25519_provider_).value();
  justification.signature[0] ^= 0xff;
  auto message = makeEnvelope(FinalityMessage{block.hash, justification});

  auto intruder = hub_->makeEndpoint("intruder", io_context_, hasher_).value();
  intruder->start();
  intruder->flood(follower_.gadget->topic(), message, false);
  runIo();
  runIo();

  EXPECT_EQ(follower_.block_tree->getLastFinalized().number, 0);
  EXPECT_EQ(validator_.block_tree->getLastFinalized().number, 0);
}

/**
 * @given error code of the finality message category not in the enum
 * @when its message is taken
 * @then it names the enum
 */
TEST(FinalityMessageErrorTest, DescribesUnlistedCode) {
  std::error_code unlisted = static_cast<FinalityMessageError>(0x7f);
  EXPECT_EQ(unlisted.message(), "Unknown FinalityMessageError");
}
