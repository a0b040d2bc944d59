/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "testutil/outcome.hpp"

using namespace singleton::common;
using namespace std::string_literals;

/**
 * @given Array of bytes
 * @when hex it
 * @then hex matches expected encoding
 */
TEST(Common, Hexutil_Hex) {
  std::vector<uint8_t> bin{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xFF};
  ASSERT_EQ(hex_lower(bin), "00010204081020ff"s);
  ASSERT_EQ(hex_lower_0x(bin), "0x00010204081020ff"s);
}

/**
 * @given Hexencoded string of even length
 * @when unhex
 * @then no exception, result matches expected value
 */
TEST(Common, Hexutil_UnhexEven) {
  auto s = "00010204081020fF"s;

  std::vector<uint8_t> actual;
  ASSERT_NO_THROW(actual = unhex(s).value())
      << "unhex result does not contain expected std::vector<uint8_t>";

  std::vector<uint8_t> expected{
      0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xFF};
  ASSERT_EQ(actual, expected);
}

/**
 * @given Hexencoded string of odd length
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexOdd) {
  EXPECT_EC(unhex("0"), UnhexError::NOT_ENOUGH_INPUT);
}

/**
 * @given Hexencoded string with non-hex letter
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexInvalid) {
  EXPECT_EC(unhex("keks"), UnhexError::NON_HEX_INPUT);
}

/**
 * @given Hex string with and without the 0x prefix
 * @when unhex it expecting the prefix
 * @then only the prefixed one is accepted
 */
TEST(Common, Hexutil_UnhexWith0x) {
  EXPECT_OUTCOME_TRUE(bytes, unhexWith0x("0x0aff"));
  EXPECT_EQ(bytes, (std::vector<uint8_t>{0x0a, 0xff}));

  EXPECT_EC(unhexWith0x("0aff"), UnhexError::MISSING_0X_PREFIX);
}

/**
 * @given Hex string of a length different from the blob size
 * @when blob is made from it
 * @then error is returned
 */
TEST(Common, Hexutil_BlobFromHexOfWrongLength) {
  EXPECT_OUTCOME_TRUE(blob, Blob<4>::fromHex("01020304"));
  EXPECT_EQ(blob, Blob<4>(std::array<uint8_t, 4>{1, 2, 3, 4}));

  EXPECT_OUTCOME_FALSE_1(Blob<4>::fromHex("010203"));
  EXPECT_OUTCOME_FALSE_1(Blob<4>::fromHexWithPrefix("01020304"));
}
