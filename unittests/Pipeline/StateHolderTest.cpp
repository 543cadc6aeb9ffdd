//===- unittests/Pipeline/StateHolderTest.cpp -----------------------------===//
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

#include "PipelineTestSupport.h"

#include "rulekit/Pipeline/StateHolder.h"

#include "gtest/gtest.h"

#include <memory>

using namespace rulekit;
using namespace rulekit::pipeline;
using namespace rulekit::unittests;

namespace {

TEST(StateHolderTest, withoutState) {
  StateHolder<TestState> holder;
  EXPECT_FALSE(holder.hasState());
  EXPECT_FALSE(holder.isFirstStage());
  EXPECT_FALSE(holder.isClosed());

  // Closing a holder which never had state is not an error.
  EXPECT_FALSE(bool(holder.close()));
  EXPECT_TRUE(holder.isClosed());
  EXPECT_FALSE(bool(holder.close()));

  StateHolder<TestState> nullState{std::unique_ptr<TestState>()};
  EXPECT_FALSE(nullState.hasState());
  EXPECT_FALSE(nullState.isFirstStage());
}

TEST(StateHolderTest, accessWithoutStateIsFatal) {
  StateHolder<TestState> holder;
  EXPECT_DEATH(holder.getState(),
               "State could not be created in the current process");
}

TEST(StateHolderTest, lifecycle) {
  int closeCount = 0;
  {
    StateHolder<TestState> holder(
        std::unique_ptr<TestState>(new TestState(closeCount)));
    EXPECT_TRUE(holder.hasState());
    EXPECT_TRUE(holder.isFirstStage());

    holder.getState().uses++;
    holder.markContinuing();
    EXPECT_FALSE(holder.isFirstStage());
    holder.getState().uses++;
    EXPECT_EQ(2, holder.getState().uses);
    EXPECT_EQ(0, closeCount);

    EXPECT_FALSE(bool(holder.close()));
    EXPECT_EQ(1, closeCount);
    EXPECT_TRUE(holder.isClosed());
    EXPECT_FALSE(holder.hasState());

    // Closing again does not release the state again.
    EXPECT_FALSE(bool(holder.close()));
    EXPECT_EQ(1, closeCount);
  }
  EXPECT_EQ(1, closeCount);
}

TEST(StateHolderTest, destructionReleasesState) {
  int closeCount = 0;
  {
    StateHolder<TestState> holder(
        std::unique_ptr<TestState>(new TestState(closeCount)));
  }
  EXPECT_EQ(1, closeCount);

  // Unused state is released as well.
  {
    StateHolder<TestState> holder(
        std::unique_ptr<TestState>(new TestState(closeCount)));
    holder.markContinuing();
  }
  EXPECT_EQ(2, closeCount);
}

TEST(StateHolderTest, releaseFailure) {
  int closeCount = 0;
  StateHolder<TestState> holder(
      std::unique_ptr<TestState>(new TestState(closeCount, "process hung")));
  Error err = holder.close();
  ASSERT_TRUE(bool(err));
  EXPECT_EQ("process hung", llvm::toString(std::move(err)));
  EXPECT_EQ(1, closeCount);
  EXPECT_FALSE(bool(holder.close()));
}

TEST(StateHolderTest, accessAfterCloseIsFatal) {
  int closeCount = 0;
  StateHolder<TestState> holder(
      std::unique_ptr<TestState>(new TestState(closeCount)));
  EXPECT_FALSE(bool(holder.close()));
  EXPECT_DEATH(holder.getState(), "Pipeline state accessed after close");
}

}
