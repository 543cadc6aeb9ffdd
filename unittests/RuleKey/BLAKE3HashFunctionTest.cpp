//===- unittests/RuleKey/BLAKE3HashFunctionTest.cpp -----------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2015 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "rulekit/RuleKey/BLAKE3HashFunction.h"

#include "llvm/ADT/StringExtras.h"

#include "gtest/gtest.h"

using namespace rulekit;
using namespace rulekit::rulekey;

namespace {

TEST(BLAKE3HashFunctionTest, digest) {
  BLAKE3HashFunction empty;
  EXPECT_EQ("blake3", empty.getName());
  EXPECT_EQ("af1349b9f5f9a1a6a0404dea36dcc949"
            "9bcb25c9adc112b7cc9a93cae41f3262", empty.finish().toHex());

  auto factory = getBLAKE3HashFunctionFactory();
  auto first = factory();
  first->update(llvm::arrayRefFromStringRef("ab"));
  first->update(llvm::arrayRefFromStringRef("c"));
  auto second = factory();
  second->update(llvm::arrayRefFromStringRef("abc"));
  HashCode digest = first->finish();
  EXPECT_EQ(32u, digest.size());
  EXPECT_EQ(digest, second->finish());
}

}
