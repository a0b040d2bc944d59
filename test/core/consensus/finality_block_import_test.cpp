/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/impl/finality_block_import.hpp"

#include <gtest/gtest.h>

#include "consensus/constants.hpp"
#include "consensus/seal_codec.hpp"
#include "consensus/sealing.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "crypto/sr25519/sr25519_provider_impl.hpp"
#include "mock/core/consensus/block_import_mock.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/outcome/dummy_error.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/sr25519_utils.hpp"

using namespace singleton;
using namespace consensus;

using primitives::BlockHash;
using primitives::BlockHeader;
using primitives::ConsensusEngineId;
using primitives::Justification;
using testing::_;
using testing::AllOf;
using testing::Field;
using testing::Return;
using testing::StrictMock;
using testutil::DummyError;

class FinalityBlockImportTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    params_.origin = BlockOrigin::kNetworkBroadcast;
    params_.header.parent_hash = "parent"_hash256;
    params_.header.number = 7;
    params_.post_hash = "block"_hash256;
    params_.fork_choice = ForkChoiceStrategy::kLongestChain;
  }

  /// Justification of the finality authority over the given hash
  Justification justify(const BlockHash &hash,
                        const crypto::Sr25519Keypair &keypair) const {
    auto j = signJustification(hash, keypair, *sr25519_provider_).value();
    return makeJustification(j);
  }

 protected:
  std::shared_ptr<crypto::Hasher> hasher_ =
      std::make_shared<crypto::HasherImpl>();
  std::shared_ptr<crypto::Sr25519Provider> sr25519_provider_ =
      std::make_shared<crypto::Sr25519ProviderImpl>();

  crypto::Sr25519Keypair finality_keypair_ = generateSr25519Keypair(0xf1);

  std::shared_ptr<StrictMock<BlockImportMock>> inner_ =
      std::make_shared<StrictMock<BlockImportMock>>();

  FinalityBlockImport block_import_{
      inner_,
      FinalityAuthority{FinalityAuthorityId{finality_keypair_.public_key},
                        sr25519_provider_},
      hasher_};

  BlockImportParams params_;
};

/**
 * @given block with a justification of the finality authority over its hash
 * @when it is imported
 * @then the inner import gets it marked finalized with the justification
 */
TEST_F(FinalityBlockImportTest, FinalizesJustifiedBlock) {
  auto justification = justify(*params_.post_hash, finality_keypair_);
  params_.justification = justification;

  EXPECT_CALL(*inner_,
              importBlock(AllOf(
                  Field(&BlockImportParams::finalized, true),
                  Field(&BlockImportParams::justification, justification),
                  Field(&BlockImportParams::post_hash, params_.post_hash))))
      .WillOnce(Return(ImportResult::kImported));

  EXPECT_OUTCOME_TRUE(result, block_import_.importBlock(params_));
  EXPECT_EQ(result, ImportResult::kImported);
}

/**
 * @given block without post-hash and with a justification over the hash of
 * its sealed form
 * @when it is imported
 * @then the hash is computed from the header with post-digests and the block
 * is finalized
 */
TEST_F(FinalityBlockImportTest, ComputesHashWhenAbsent) {
  params_.post_hash.reset();
  params_.post_digests.emplace_back(
      makeSealDigest(Seal{crypto::Sr25519Signature{}}));
  auto hash = primitives::calculateBlockHash(params_.postHeader(), *hasher_);
  params_.justification = justify(hash, finality_keypair_);

  EXPECT_CALL(*inner_,
              importBlock(Field(&BlockImportParams::finalized, true)))
      .WillOnce(Return(ImportResult::kImported));

  EXPECT_OUTCOME_TRUE_1(block_import_.importBlock(params_));
}

/**
 * @given block with a justification over another block hash
 * @when it is imported
 * @then the block is imported as is, not finalized
 */
TEST_F(FinalityBlockImportTest, ImportsUnfinalizedOnMismatch) {
  auto justification = justify("another_block"_hash256, finality_keypair_);
  params_.justification = justification;

  EXPECT_CALL(*inner_,
              importBlock(AllOf(
                  Field(&BlockImportParams::finalized, false),
                  Field(&BlockImportParams::justification, justification))))
      .WillOnce(Return(ImportResult::kImported));

  EXPECT_OUTCOME_TRUE_1(block_import_.importBlock(params_));
}

/**
 * @given block with a justification signed by a key other than the finality
 * authority
 * @when it is imported
 * @then the block is imported, not finalized
 */
TEST_F(FinalityBlockImportTest, ImportsUnfinalizedOnForeignSigner) {
  params_.justification =
      justify(*params_.post_hash, generateSr25519Keypair(0x02));

  EXPECT_CALL(*inner_,
              importBlock(Field(&BlockImportParams::finalized, false)))
      .WillOnce(Return(ImportResult::kImported));

  EXPECT_OUTCOME_TRUE_1(block_import_.importBlock(params_));
}

/**
 * @given block with justifications that can not be decoded
 * @when it is imported
 * @then the justification is ignored and the block is imported not finalized
 */
TEST_F(FinalityBlockImportTest, IgnoresUndecodableJustification) {
  auto foreign = justify(*params_.post_hash, finality_keypair_);
  foreign.engine_id =
      ConsensusEngineId(std::array<uint8_t, 4>{'F', 'R', 'N', 'K'});

  auto truncated = justify(*params_.post_hash, finality_keypair_);
  truncated.data.resize(3);

  EXPECT_CALL(*inner_,
              importBlock(Field(&BlockImportParams::finalized, false)))
      .Times(2)
      .WillRepeatedly(Return(ImportResult::kImported));

  params_.justification = foreign;
  EXPECT_OUTCOME_TRUE_1(block_import_.importBlock(params_));

  params_.justification = truncated;
  EXPECT_OUTCOME_TRUE_1(block_import_.importBlock(params_));
}

/**
 * @given block without justification
 * @when it is imported
 * @then it is passed to the inner import untouched and its result is returned
 */
TEST_F(FinalityBlockImportTest, PassesThroughUnjustifiedBlock) {
  EXPECT_CALL(*inner_,
              importBlock(AllOf(
                  Field(&BlockImportParams::finalized, false),
                  Field(&BlockImportParams::justification, std::nullopt))))
      .WillOnce(Return(ImportResult::kAlreadyInChain));

  EXPECT_OUTCOME_TRUE(result, block_import_.importBlock(params_));
  EXPECT_EQ(result, ImportResult::kAlreadyInChain);
}

/**
 * @given inner import failing
 * @when a block is imported
 * @then CLIENT_IMPORT is returned
 */
TEST_F(FinalityBlockImportTest, WrapsImportError) {
  EXPECT_CALL(*inner_, importBlock(_)).WillOnce(Return(DummyError::ERROR));

  EXPECT_EC(block_import_.importBlock(params_),
            BlockImportError::CLIENT_IMPORT);
}

/**
 * @given inner import answering and then failing a check
 * @when block availability is checked
 * @then the answer is passed through and the failure becomes CLIENT_CHECK
 */
TEST_F(FinalityBlockImportTest, DelegatesCheck) {
  BlockCheckParams check{"block"_hash256, 7, "parent"_hash256};

  EXPECT_CALL(*inner_, checkBlock(_))
      .WillOnce(Return(ImportResult::kUnknownParent))
      .WillOnce(Return(DummyError::ERROR));

  EXPECT_OUTCOME_TRUE(result, block_import_.checkBlock(check));
  EXPECT_EQ(result, ImportResult::kUnknownParent);

  EXPECT_EC(block_import_.checkBlock(check), BlockImportError::CLIENT_CHECK);
}
