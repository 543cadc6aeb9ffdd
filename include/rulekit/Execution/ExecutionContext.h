//===- ExecutionContext.h ---------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_EXECUTION_EXECUTIONCONTEXT_H
#define RULEKIT_EXECUTION_EXECUTIONCONTEXT_H

#include "rulekit/Basic/Compiler.h"
#include "rulekit/Basic/LLVM.h"
#include "rulekit/Execution/BuildEvent.h"
#include "rulekit/Execution/Console.h"
#include "rulekit/Execution/IsolatedEventBus.h"
#include "rulekit/Execution/Platform.h"
#include "rulekit/Execution/PluginLoaderCache.h"
#include "rulekit/Execution/ProcessExecutor.h"
#include "rulekit/Execution/Verbosity.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <map>
#include <memory>
#include <string>

namespace rulekit {
namespace execution {

/// The services available to one build step.
///
/// A context owns its process executor and its reference on the plugin
/// loader cache. The event bus belongs to the surrounding build invocation
/// and must outlive every context using it.
class ExecutionContext {
  Console console;
  IsolatedEventBus& eventBus;
  std::unique_ptr<ProcessExecutor> processExecutor;
  std::shared_ptr<PluginLoaderCache> pluginLoaderCache;
  std::string cellRoot;
  std::map<std::string, std::string> environment;
  Platform platform;

  /// The redirected output streams owned by a sub-context. They stay alive
  /// until the context is destroyed since the console and the process
  /// executor refer to them.
  std::unique_ptr<raw_ostream> ownedStdOut;
  std::unique_ptr<raw_ostream> ownedStdErr;

  /// The owned streams which are file streams, whose write errors are
  /// reported on close.
  llvm::raw_fd_ostream* ownedStdOutFile = nullptr;
  llvm::raw_fd_ostream* ownedStdErrFile = nullptr;

  bool closed = false;

  // Copying is disabled.
  ExecutionContext(const ExecutionContext&) RULEKIT_DELETED_FUNCTION;
  void operator=(const ExecutionContext&) RULEKIT_DELETED_FUNCTION;

public:
  /// Create a root context.
  ///
  /// The context adopts the initial reference of \arg pluginLoaderCache.
  ExecutionContext(const Console& console, IsolatedEventBus& eventBus,
                   std::unique_ptr<ProcessExecutor> processExecutor,
                   std::shared_ptr<PluginLoaderCache> pluginLoaderCache,
                   StringRef cellRoot,
                   std::map<std::string, std::string> environment = {},
                   Platform platform = detectPlatform());

  /// Close the context, logging any release failures.
  ~ExecutionContext();

  /// @name Accessors
  /// @{

  const Console& getConsole() const { return console; }
  Verbosity getVerbosity() const { return console.getVerbosity(); }
  raw_ostream& getStdOut() const { return console.getStdOut(); }
  raw_ostream& getStdErr() const { return console.getStdErr(); }

  IsolatedEventBus& getEventBus() const { return eventBus; }
  ProcessExecutor& getProcessExecutor() const { return *processExecutor; }
  PluginLoaderCache& getPluginLoaderCache() const {
    return *pluginLoaderCache;
  }

  StringRef getCellRoot() const { return cellRoot; }
  const std::map<std::string, std::string>& getEnvironment() const {
    return environment;
  }
  Platform getPlatform() const { return platform; }

  bool isClosed() const { return closed; }

  /// @}

  /// Post \arg event to the build's event bus.
  void postEvent(std::shared_ptr<BuildEvent> event) const {
    eventBus.post(std::move(event));
  }

  /// Derive a context writing to different streams.
  ///
  /// The sub-context shares the event bus, cell root and environment, and
  /// takes its own reference on the plugin loader cache. The streams must
  /// outlive the sub-context.
  ///
  /// \param verbosity The verbosity to use, or None to inherit it.
  std::unique_ptr<ExecutionContext>
  createSubContext(raw_ostream& stdOut, raw_ostream& stdErr,
                   Optional<Verbosity> verbosity = None);

  /// Derive a context which owns its redirected streams.
  std::unique_ptr<ExecutionContext>
  createSubContext(std::unique_ptr<raw_ostream> stdOut,
                   std::unique_ptr<raw_ostream> stdErr,
                   Optional<Verbosity> verbosity = None);

  /// Derive a context which owns its redirected file streams.
  ///
  /// Write failures on either file are reported by close().
  std::unique_ptr<ExecutionContext>
  createSubContext(std::unique_ptr<llvm::raw_fd_ostream> stdOut,
                   std::unique_ptr<llvm::raw_fd_ostream> stdErr,
                   Optional<Verbosity> verbosity = None);

  /// Release everything this context owns.
  ///
  /// Every release is attempted even if an earlier one fails; the failures
  /// are returned together. Owned streams are flushed but remain writable
  /// until destruction. Closing a closed context does nothing.
  Error close();
};

}
}

#endif
