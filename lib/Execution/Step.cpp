//===-- Step.cpp ----------------------------------------------------------===//
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

#include "rulekit/Execution/Step.h"

#include "rulekit/Basic/ShellUtility.h"
#include "rulekit/Execution/BuildEvent.h"
#include "rulekit/Execution/ExecutionContext.h"
#include "rulekit/Execution/ProcessExecutor.h"

using namespace rulekit;
using namespace rulekit::execution;

Step::~Step() {}

Expected<StepExecutionResult> rulekit::execution::runStep(
    Step& step, ExecutionContext& context) {
  auto started = StepEvent::started(step.getShortName(),
                                    step.getDescription(context),
                                    getNextStepId());
  context.postEvent(started);

  auto result = step.execute(context);
  context.postEvent(StepEvent::finished(*started,
                                        result ? result->exitCode : -1));
  return result;
}

ShellStep::ShellStep(StringRef shortName, std::vector<std::string> command,
                     StringRef workingDirectory,
                     std::map<std::string, std::string> environmentOverrides)
  : shortName(shortName), command(std::move(command)),
    workingDirectory(workingDirectory),
    environmentOverrides(std::move(environmentOverrides)) {}

std::string ShellStep::getDescription(const ExecutionContext&) const {
  std::string description;
  if (!workingDirectory.empty()) {
    description += "(cd " + basic::shellEscaped(workingDirectory) + " && ";
  }
  description += basic::formatCommandLine(command);
  if (!workingDirectory.empty())
    description += ")";
  return description;
}

Expected<StepExecutionResult> ShellStep::execute(ExecutionContext& context) {
  if (shouldPrintCommand(context.getVerbosity())) {
    context.getStdErr() << getDescription(context) << "\n";
  }

  ProcessExecutorParams params;
  params.command = command;
  params.workingDirectory = workingDirectory;
  if (!context.getEnvironment().empty() || !environmentOverrides.empty()) {
    std::map<std::string, std::string> environment =
      context.getEnvironment();
    for (const auto& entry: environmentOverrides) {
      environment[entry.first] = entry.second;
    }
    params.environment = environment;
  }

  // Output is only forwarded when the console asks for it; otherwise it is
  // kept for the failure report.
  params.captureOutput = !shouldPrintOutput(context.getVerbosity());

  auto result = context.getProcessExecutor().execute(params);
  if (!result)
    return result.takeError();

  if (!result->isSuccess() && params.captureOutput &&
      !isSilent(context.getVerbosity())) {
    context.getStdErr() << result->stdErr;
  }
  return StepExecutionResult(result->exitCode, result->stdErr);
}
