//===- Step.h ---------------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_EXECUTION_STEP_H
#define RULEKIT_EXECUTION_STEP_H

#include "rulekit/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <map>
#include <string>
#include <vector>

namespace rulekit {
namespace execution {

class ExecutionContext;

struct StepExecutionResult {
  int exitCode;

  /// The error output of the step, if it was captured.
  std::string stdErr;

  explicit StepExecutionResult(int exitCode, StringRef stdErr = "")
    : exitCode(exitCode), stdErr(stdErr) {}

  static StepExecutionResult makeSuccess() { return StepExecutionResult(0); }

  bool isSuccess() const { return exitCode == 0; }
};

/// A unit of work run against an execution context.
class Step {
public:
  virtual ~Step();

  /// Get a short name identifying the kind of step, e.g. "javac".
  virtual StringRef getShortName() const = 0;

  /// Get a description of the work, e.g. the command line.
  virtual std::string getDescription(const ExecutionContext& context) const = 0;

  /// Run the step.
  ///
  /// \returns The step result, or an error if the step could not be run at
  /// all.
  virtual Expected<StepExecutionResult> execute(ExecutionContext& context) = 0;
};

/// Run \arg step, posting step events around it.
Expected<StepExecutionResult> runStep(Step& step, ExecutionContext& context);

/// A step running one command line.
class ShellStep : public Step {
  std::string shortName;
  std::vector<std::string> command;
  std::string workingDirectory;
  std::map<std::string, std::string> environmentOverrides;

public:
  ShellStep(StringRef shortName, std::vector<std::string> command,
            StringRef workingDirectory = "",
            std::map<std::string, std::string> environmentOverrides = {});

  const std::vector<std::string>& getCommand() const { return command; }

  StringRef getShortName() const override { return shortName; }
  std::string getDescription(const ExecutionContext& context) const override;
  Expected<StepExecutionResult> execute(ExecutionContext& context) override;
};

}
}

#endif
