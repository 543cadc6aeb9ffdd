//===- StateHolder.h --------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_PIPELINE_STATEHOLDER_H
#define RULEKIT_PIPELINE_STATEHOLDER_H

#include "rulekit/Basic/Compiler.h"
#include "rulekit/Basic/LLVM.h"
#include "rulekit/Pipeline/RulePipelineState.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

#include <memory>
#include <type_traits>

namespace rulekit {
namespace pipeline {

/// Messages of the fatal errors raised on misuse of a \see StateHolder.
extern const char* const StateUnavailableMessage;
extern const char* const StateClosedMessage;

/// Owns the state of one pipeline for the whole sequence of its stages.
///
/// A holder is created with or without state. With state, it starts at the
/// first stage and moves to continuation stages via \see markContinuing().
/// Closing releases the state exactly once, whether or not any stage used it;
/// closing a holder without state, or a closed holder, does nothing.
///
/// Holders are used by a single pipeline at a time and do no locking.
template<typename State>
class StateHolder {
  static_assert(std::is_base_of<RulePipelineState, State>::value,
                "pipeline state must derive from RulePipelineState");

  std::unique_ptr<State> state;
  bool firstStage;
  bool closed = false;

  // Copying is disabled.
  StateHolder(const StateHolder&) RULEKIT_DELETED_FUNCTION;
  void operator=(const StateHolder&) RULEKIT_DELETED_FUNCTION;

public:
  /// Create a holder without state.
  StateHolder() : firstStage(false) {}

  /// Create a holder owning \arg state, which may be null.
  explicit StateHolder(std::unique_ptr<State> state)
    : state(std::move(state)), firstStage(this->state != nullptr) {}

  /// Close the holder, logging a failure to release the state.
  ~StateHolder() {
    if (Error err = close()) {
      llvm::logAllUnhandledErrors(std::move(err), llvm::errs(),
                                  "error: releasing pipeline state: ");
    }
  }

  bool hasState() const { return state != nullptr; }
  bool isClosed() const { return closed; }

  /// Get the pipeline state.
  ///
  /// It is a fatal error to call this on a holder without state, or after
  /// close.
  State& getState() {
    if (closed)
      llvm::report_fatal_error(StateClosedMessage);
    if (!state)
      llvm::report_fatal_error(StateUnavailableMessage);
    return *state;
  }

  /// Check whether the current stage is the first one using the state.
  bool isFirstStage() const { return firstStage; }

  /// Move on to a continuation stage.
  void markContinuing() { firstStage = false; }

  /// Release the state, if any.
  ///
  /// \returns The failure of the state's own release.
  Error close() {
    if (closed)
      return Error::success();
    closed = true;
    firstStage = false;

    if (!state)
      return Error::success();
    Error result = state->close();
    state.reset();
    return result;
  }
};

}
}

#endif
