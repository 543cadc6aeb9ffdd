//===- ProcessExecutor.h ----------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_EXECUTION_PROCESSEXECUTOR_H
#define RULEKIT_EXECUTION_PROCESSEXECUTOR_H

#include "rulekit/Basic/Compiler.h"
#include "rulekit/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rulekit {
namespace execution {

enum class ProcessStatus {
  Succeeded = 0,
  Failed,
  Cancelled,
};

/// Result of a process execution.
struct ProcessResult {
  /// The final status of the command.
  ProcessStatus status;

  /// Process exit code, or the negated signal number if the process was
  /// killed by a signal.
  int exitCode;

  /// The captured output, when requested.
  std::string stdOut;
  std::string stdErr;

  ProcessResult(ProcessStatus status, int exitCode = -1)
    : status(status), exitCode(exitCode) {}

  static ProcessResult makeSucceeded() {
    return ProcessResult(ProcessStatus::Succeeded, 0);
  }

  static ProcessResult makeFailed(int exitCode = -1) {
    return ProcessResult(ProcessStatus::Failed, exitCode);
  }

  bool isSuccess() const { return status == ProcessStatus::Succeeded; }
};

struct ProcessExecutorParams {
  /// The program and its arguments. A program without a '/' is looked up in
  /// PATH.
  std::vector<std::string> command;

  /// The working directory, or empty for the current one.
  std::string workingDirectory;

  /// The complete environment, or None to inherit this process's.
  Optional<std::map<std::string, std::string>> environment;

  /// Whether to capture the output into the result instead of forwarding it
  /// to the executor's streams.
  bool captureOutput = false;
};

/// Runs external processes on behalf of build steps.
class ProcessExecutor {
  // Copying is disabled.
  ProcessExecutor(const ProcessExecutor&) RULEKIT_DELETED_FUNCTION;
  void operator=(const ProcessExecutor&) RULEKIT_DELETED_FUNCTION;

public:
  ProcessExecutor() {}
  virtual ~ProcessExecutor();

  /// Run a process to completion.
  ///
  /// \returns The result, or an error if the process could not be started.
  /// A process which runs and fails is not an error.
  virtual Expected<ProcessResult>
  execute(const ProcessExecutorParams& params) = 0;

  /// Get an executor which forwards process output to other streams.
  virtual std::unique_ptr<ProcessExecutor>
  cloneWithOutputStreams(raw_ostream& stdOut, raw_ostream& stdErr) = 0;
};

/// Executes processes on the local machine using posix_spawn.
class LocalProcessExecutor : public ProcessExecutor {
  raw_ostream& stdOut;
  raw_ostream& stdErr;

public:
  LocalProcessExecutor(raw_ostream& stdOut, raw_ostream& stdErr)
    : stdOut(stdOut), stdErr(stdErr) {}

  Expected<ProcessResult>
  execute(const ProcessExecutorParams& params) override;

  std::unique_ptr<ProcessExecutor>
  cloneWithOutputStreams(raw_ostream& newStdOut,
                         raw_ostream& newStdErr) override;
};

}
}

#endif
