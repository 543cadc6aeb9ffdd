//===-- RulePipelineState.cpp ---------------------------------------------===//
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

#include "rulekit/Pipeline/RulePipelineState.h"
#include "rulekit/Pipeline/StateHolder.h"

#include "llvm/Support/raw_ostream.h"

using namespace rulekit;
using namespace rulekit::pipeline;

const char* const rulekit::pipeline::StateUnavailableMessage =
  "State could not be created in the current process";
const char* const rulekit::pipeline::StateClosedMessage =
  "Pipeline state accessed after close";

RulePipelineState::~RulePipelineState() {}

char StateUnavailableError::ID = 0;

void StateUnavailableError::log(raw_ostream& os) const {
  os << "pipeline '" << pipelineName << "': " << StateUnavailableMessage
     << " (pipelining across processes is not supported)";
}

std::error_code StateUnavailableError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}
