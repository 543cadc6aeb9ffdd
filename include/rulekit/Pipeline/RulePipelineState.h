//===- RulePipelineState.h --------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_PIPELINE_RULEPIPELINESTATE_H
#define RULEKIT_PIPELINE_RULEPIPELINESTATE_H

#include "rulekit/Basic/LLVM.h"

#include "llvm/Support/Error.h"

#include <string>
#include <system_error>

namespace rulekit {
namespace pipeline {

/// A resource shared by the stages of one pipeline, e.g. a warm toolchain
/// process.
class RulePipelineState {
public:
  virtual ~RulePipelineState();

  /// Release the resource.
  ///
  /// The owning \see StateHolder calls this exactly once.
  virtual Error close() = 0;
};

/// The error reported when a pipeline needs state which cannot be created in
/// the current process.
class StateUnavailableError : public llvm::ErrorInfo<StateUnavailableError> {
  std::string pipelineName;

public:
  static char ID;

  explicit StateUnavailableError(StringRef pipelineName)
    : pipelineName(pipelineName) {}

  StringRef getPipelineName() const { return pipelineName; }

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;
};

}
}

#endif
