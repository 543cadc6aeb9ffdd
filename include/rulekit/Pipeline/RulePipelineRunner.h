//===- RulePipelineRunner.h -------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_PIPELINE_RULEPIPELINERUNNER_H
#define RULEKIT_PIPELINE_RULEPIPELINERUNNER_H

#include "rulekit/Basic/Compiler.h"
#include "rulekit/Basic/LLVM.h"
#include "rulekit/Execution/BuildEvent.h"
#include "rulekit/Execution/ExecutionContext.h"
#include "rulekit/Pipeline/RulePipelineState.h"
#include "rulekit/Pipeline/StateHolder.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rulekit {
namespace pipeline {

/// One step of a pipeline.
template<typename State>
class PipelineStage {
public:
  virtual ~PipelineStage() {}

  virtual StringRef getName() const = 0;

  /// Check whether the stage uses the pipeline state.
  ///
  /// Stages which do not are handed a holder without state.
  virtual bool usesState() const { return true; }

  virtual Error run(execution::ExecutionContext& context,
                    StateHolder<State>& holder) = 0;
};

/// Runs the stages of one pipeline in order, sharing one state.
///
/// The state is created when the first stage using it starts, and released
/// when the pipeline finishes, fails or is cancelled.
template<typename State>
class RulePipelineRunner {
public:
  /// Creates the state for a pipeline; a null state means pipelining is not
  /// available in this process.
  typedef std::function<Expected<std::unique_ptr<State>>(
      execution::ExecutionContext&)> StateFactory;

private:
  std::string name;
  StateFactory stateFactory;
  std::vector<std::unique_ptr<PipelineStage<State>>> stages;
  std::atomic<bool> cancelled{false};

  static Error makeStageError(StringRef stageName, const Twine& message) {
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "pipeline stage '" + stageName + "': " +
                                   message);
  }

  Error runStages(execution::ExecutionContext& baseContext,
                  std::unique_ptr<StateHolder<State>>& holder) {
    StateHolder<State> noState;
    for (auto& stage: stages) {
      if (cancelled) {
        return llvm::createStringError(
            llvm::inconvertibleErrorCode(),
            "pipeline '" + name + "' cancelled before stage '" +
            stage->getName() + "'");
      }

      StateHolder<State>* stageHolder = &noState;
      if (stage->usesState()) {
        if (!holder) {
          auto state = stateFactory(baseContext);
          if (!state)
            return state.takeError();
          if (!*state)
            return llvm::make_error<StateUnavailableError>(name);
          holder.reset(new StateHolder<State>(std::move(*state)));
        }
        stageHolder = holder.get();
      }

      auto context = baseContext.createSubContext(baseContext.getStdOut(),
                                                  baseContext.getStdErr());
      auto started = execution::StepEvent::started(
          stage->getName(), "pipeline " + name, execution::getNextStepId());
      context->postEvent(started);

      Error stageError = stage->run(*context, *stageHolder);
      context->postEvent(execution::StepEvent::finished(
                             *started, stageError ? 1 : 0));
      if (stage->usesState())
        holder->markContinuing();

      Error closeError = context->close();
      if (stageError || closeError) {
        Error failure = llvm::joinErrors(std::move(stageError),
                                         std::move(closeError));
        return makeStageError(stage->getName(),
                              llvm::toString(std::move(failure)));
      }
    }
    return Error::success();
  }

  // Copying is disabled.
  RulePipelineRunner(const RulePipelineRunner&) RULEKIT_DELETED_FUNCTION;
  void operator=(const RulePipelineRunner&) RULEKIT_DELETED_FUNCTION;

public:
  RulePipelineRunner(StringRef name, StateFactory stateFactory)
    : name(name), stateFactory(std::move(stateFactory)) {}

  StringRef getName() const { return name; }

  void addStage(std::unique_ptr<PipelineStage<State>> stage) {
    stages.push_back(std::move(stage));
  }

  size_t getNumStages() const { return stages.size(); }

  /// Request cancellation; stages not yet started will not run.
  ///
  /// This may be called from any thread.
  void cancel() { cancelled = true; }

  bool isCancelled() const { return cancelled; }

  /// Run all stages in order against sub-contexts of \arg baseContext.
  ///
  /// \returns The first failure, combined with any failure to release the
  /// state. A missing state is reported as a \see StateUnavailableError.
  Error run(execution::ExecutionContext& baseContext) {
    std::unique_ptr<StateHolder<State>> holder;
    Error result = runStages(baseContext, holder);
    Error closeError = holder ? holder->close() : Error::success();
    return llvm::joinErrors(std::move(result), std::move(closeError));
  }
};

}
}

#endif
