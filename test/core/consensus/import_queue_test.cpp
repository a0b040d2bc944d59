/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/impl/import_queue_impl.hpp"

#include <gtest/gtest.h>

#include "mock/core/consensus/block_import_mock.hpp"
#include "mock/core/consensus/verifier_mock.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace singleton;
using namespace consensus;

using primitives::BlockHeader;
using testing::_;
using testing::AllOf;
using testing::Field;
using testing::Return;
using testing::StrictMock;

class ImportQueueTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    header_.parent_hash = "parent"_hash256;
    header_.number = 3;

    params_.origin = BlockOrigin::kNetworkBroadcast;
    params_.header = header_;
    params_.post_hash = "block"_hash256;
    params_.fork_choice = ForkChoiceStrategy::kLongestChain;
  }

 protected:
  std::shared_ptr<StrictMock<VerifierMock>> verifier_ =
      std::make_shared<StrictMock<VerifierMock>>();
  std::shared_ptr<StrictMock<BlockImportMock>> block_import_ =
      std::make_shared<StrictMock<BlockImportMock>>();

  ImportQueueImpl import_queue_{verifier_, block_import_};

  BlockHeader header_;
  BlockImportParams params_;
};

/**
 * @given verifier accepting the block and ledger not knowing it yet
 * @when the block is queued
 * @then it is checked by its post hash and imported
 */
TEST_F(ImportQueueTest, ImportsVerifiedBlock) {
  EXPECT_CALL(*verifier_,
              verify(BlockOrigin::kNetworkBroadcast, header_, _, _))
      .WillOnce(Return(params_));
  EXPECT_CALL(*block_import_,
              checkBlock(AllOf(
                  Field(&BlockCheckParams::hash, "block"_hash256),
                  Field(&BlockCheckParams::number, 3u),
                  Field(&BlockCheckParams::parent_hash, "parent"_hash256))))
      .WillOnce(Return(ImportResult::kImported));
  EXPECT_CALL(*block_import_,
              importBlock(Field(&BlockImportParams::post_hash,
                                params_.post_hash)))
      .WillOnce(Return(ImportResult::kImported));

  EXPECT_OUTCOME_TRUE(result,
                      import_queue_.importBlock(BlockOrigin::kNetworkBroadcast,
                                                header_,
                                                std::nullopt,
                                                primitives::BlockBody{}));
  EXPECT_EQ(result, ImportResult::kImported);
}

/**
 * @given verifier rejecting the block
 * @when the block is queued
 * @then the verification error is returned and nothing is imported
 */
TEST_F(ImportQueueTest, DropsUnverifiedBlock) {
  EXPECT_CALL(*verifier_, verify(_, _, _, _))
      .WillOnce(Return(VerificationError::INVALID_SEAL_SIGNATURE));

  EXPECT_EC(import_queue_.importBlock(
                BlockOrigin::kNetworkBroadcast, header_, std::nullopt, {}),
            VerificationError::INVALID_SEAL_SIGNATURE);
}

/**
 * @given block already known to the ledger
 * @when the block is queued
 * @then the check result is returned and the block is not imported again
 */
TEST_F(ImportQueueTest, SkipsKnownBlock) {
  EXPECT_CALL(*verifier_, verify(_, _, _, _)).WillOnce(Return(params_));
  EXPECT_CALL(*block_import_, checkBlock(_))
      .WillOnce(Return(ImportResult::kAlreadyInChain));

  EXPECT_OUTCOME_TRUE(result,
                      import_queue_.importBlock(BlockOrigin::kNetworkBroadcast,
                                                header_,
                                                std::nullopt,
                                                std::nullopt));
  EXPECT_EQ(result, ImportResult::kAlreadyInChain);
}

/**
 * @given block whose parent the ledger does not know
 * @when the block is queued
 * @then kUnknownParent is returned and the block is dropped
 */
TEST_F(ImportQueueTest, DropsOrphan) {
  EXPECT_CALL(*verifier_, verify(_, _, _, _)).WillOnce(Return(params_));
  EXPECT_CALL(*block_import_, checkBlock(_))
      .WillOnce(Return(ImportResult::kUnknownParent));

  EXPECT_OUTCOME_TRUE(result,
                      import_queue_.importBlock(BlockOrigin::kNetworkBroadcast,
                                                header_,
                                                std::nullopt,
                                                std::nullopt));
  EXPECT_EQ(result, ImportResult::kUnknownParent);
}

/**
 * @given ledger failing to import a verified block
 * @when the block is queued
 * @then the import error is returned
 */
TEST_F(ImportQueueTest, ReportsImportFailure) {
  EXPECT_CALL(*verifier_, verify(_, _, _, _)).WillOnce(Return(params_));
  EXPECT_CALL(*block_import_, checkBlock(_))
      .WillOnce(Return(ImportResult::kImported));
  EXPECT_CALL(*block_import_, importBlock(_))
      .WillOnce(Return(BlockImportError::CLIENT_IMPORT));

  EXPECT_EC(import_queue_.importBlock(
                BlockOrigin::kNetworkBroadcast, header_, std::nullopt, {}),
            BlockImportError::CLIENT_IMPORT);
}
