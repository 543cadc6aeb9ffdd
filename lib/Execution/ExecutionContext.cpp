//===-- ExecutionContext.cpp ----------------------------------------------===//
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

#include "rulekit/Execution/ExecutionContext.h"

using namespace rulekit;
using namespace rulekit::execution;

/// Flush an owned stream, reporting write failures on a file stream instead
/// of letting it abort the process when destroyed.
static Error flushStream(raw_ostream* stream, llvm::raw_fd_ostream* file,
                         StringRef name) {
  if (!stream)
    return Error::success();

  stream->flush();
  if (!file)
    return Error::success();

  std::error_code writeError = file->error();
  file->clear_error();
  if (!writeError)
    return Error::success();
  return llvm::createStringError(writeError, "unable to write %s: %s",
                                 name.str().c_str(),
                                 writeError.message().c_str());
}

ExecutionContext::ExecutionContext(
    const Console& console, IsolatedEventBus& eventBus,
    std::unique_ptr<ProcessExecutor> processExecutor,
    std::shared_ptr<PluginLoaderCache> pluginLoaderCache, StringRef cellRoot,
    std::map<std::string, std::string> environment, Platform platform)
  : console(console), eventBus(eventBus),
    processExecutor(std::move(processExecutor)),
    pluginLoaderCache(std::move(pluginLoaderCache)), cellRoot(cellRoot),
    environment(std::move(environment)), platform(platform) {}

ExecutionContext::~ExecutionContext() {
  if (Error err = close()) {
    llvm::logAllUnhandledErrors(std::move(err), llvm::errs(),
                                "error: closing execution context: ");
  }

  // Output written after close is flushed here.
  Error late = flushStream(ownedStdOut.get(), ownedStdOutFile, "step output");
  late = llvm::joinErrors(
      std::move(late),
      flushStream(ownedStdErr.get(), ownedStdErrFile, "step error output"));
  if (late) {
    llvm::logAllUnhandledErrors(std::move(late), llvm::errs(),
                                "error: closing execution context: ");
  }
}

std::unique_ptr<ExecutionContext>
ExecutionContext::createSubContext(raw_ostream& stdOut, raw_ostream& stdErr,
                                   Optional<Verbosity> verbosity) {
  Console subConsole = console.withStreams(stdOut, stdErr);
  if (verbosity.hasValue())
    subConsole = subConsole.withVerbosity(*verbosity);

  pluginLoaderCache->addRef();
  return std::unique_ptr<ExecutionContext>(new ExecutionContext(
      subConsole, eventBus,
      processExecutor->cloneWithOutputStreams(stdOut, stdErr),
      pluginLoaderCache, cellRoot, environment, platform));
}

std::unique_ptr<ExecutionContext>
ExecutionContext::createSubContext(std::unique_ptr<raw_ostream> stdOut,
                                   std::unique_ptr<raw_ostream> stdErr,
                                   Optional<Verbosity> verbosity) {
  auto context = createSubContext(*stdOut, *stdErr, verbosity);
  context->ownedStdOut = std::move(stdOut);
  context->ownedStdErr = std::move(stdErr);
  return context;
}

std::unique_ptr<ExecutionContext>
ExecutionContext::createSubContext(std::unique_ptr<llvm::raw_fd_ostream> stdOut,
                                   std::unique_ptr<llvm::raw_fd_ostream> stdErr,
                                   Optional<Verbosity> verbosity) {
  llvm::raw_fd_ostream* stdOutFile = stdOut.get();
  llvm::raw_fd_ostream* stdErrFile = stdErr.get();
  auto context = createSubContext(std::unique_ptr<raw_ostream>(
                                      std::move(stdOut)),
                                  std::unique_ptr<raw_ostream>(
                                      std::move(stdErr)),
                                  verbosity);
  context->ownedStdOutFile = stdOutFile;
  context->ownedStdErrFile = stdErrFile;
  return context;
}

Error ExecutionContext::close() {
  if (closed)
    return Error::success();
  closed = true;

  // Attempt every release; collect the failures.
  Error result = pluginLoaderCache->close();
  result = llvm::joinErrors(
      std::move(result),
      flushStream(ownedStdOut.get(), ownedStdOutFile, "step output"));
  result = llvm::joinErrors(
      std::move(result),
      flushStream(ownedStdErr.get(), ownedStdErrFile, "step error output"));
  return result;
}
