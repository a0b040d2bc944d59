/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include "outcome/outcome.hpp"

/**
 * Checks that `expr` holds a value and binds it to `val`:
 *   EXPECT_OUTCOME_TRUE(header, block_tree->getBlockHeader(hash));
 */
#define EXPECT_OUTCOME_TRUE(val, expr) \
  SINGLETON_EXPECT_VALUE(OUTCOME_UNIQUE, val, expr)

#define SINGLETON_EXPECT_VALUE(res, val, expr) \
  auto &&res = (expr);                         \
  EXPECT_TRUE(res) << res.error();             \
  auto &&val = res.value();

/// Checks that `expr` succeeded, the value is dropped
#define EXPECT_OUTCOME_TRUE_1(expr) \
  SINGLETON_EXPECT_SUCCESS(OUTCOME_UNIQUE, expr)

#define SINGLETON_EXPECT_SUCCESS(res, expr) \
  auto &&res = (expr);                      \
  EXPECT_TRUE(res) << res.error();

/// Checks that `expr` failed with whatever error
#define EXPECT_OUTCOME_FALSE_1(expr) EXPECT_FALSE(expr)

/// Checks that `expr` failed with exactly `expected`
#define EXPECT_EC(expr, expected) \
  SINGLETON_EXPECT_ERROR(OUTCOME_UNIQUE, expr, expected)

#define SINGLETON_EXPECT_ERROR(res, expr, expected) \
  auto &&res = (expr);                              \
  EXPECT_TRUE(res.has_error());                     \
  EXPECT_EQ(res.error(), (expected));
