//===- unittests/Pipeline/PipelineTestSupport.h ---------------------------===//
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

#ifndef RULEKIT_UNITTESTS_PIPELINE_PIPELINETESTSUPPORT_H
#define RULEKIT_UNITTESTS_PIPELINE_PIPELINETESTSUPPORT_H

#include "rulekit/Pipeline/RulePipelineState.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>

namespace rulekit {
namespace unittests {

/// A state which counts how often it was released.
class TestState : public pipeline::RulePipelineState {
  int& closeCount;
  std::string closeFailure;

public:
  int uses = 0;

  explicit TestState(int& closeCount, llvm::StringRef closeFailure = "")
    : closeCount(closeCount), closeFailure(closeFailure) {}

  llvm::Error close() override {
    ++closeCount;
    if (closeFailure.empty())
      return llvm::Error::success();
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   closeFailure);
  }
};

}
}

#endif
