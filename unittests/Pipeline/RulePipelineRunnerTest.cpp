//===- unittests/Pipeline/RulePipelineRunnerTest.cpp ----------------------===//
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

#include "PipelineTestSupport.h"

#include "rulekit/Execution/BuildEvent.h"
#include "rulekit/Execution/Console.h"
#include "rulekit/Execution/ExecutionContext.h"
#include "rulekit/Execution/IsolatedEventBus.h"
#include "rulekit/Execution/PluginLoaderCache.h"
#include "rulekit/Execution/ProcessExecutor.h"
#include "rulekit/Pipeline/RulePipelineRunner.h"

#include "llvm/Support/Casting.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include "gtest/gtest.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace rulekit;
using namespace rulekit::execution;
using namespace rulekit::pipeline;
using namespace rulekit::unittests;

namespace {

typedef std::function<Error(ExecutionContext&, StateHolder<TestState>&)>
  StageBody;

class FunctionStage : public PipelineStage<TestState> {
  std::string name;
  bool stateful;
  StageBody body;

public:
  FunctionStage(StringRef name, bool stateful, StageBody body)
    : name(name), stateful(stateful), body(std::move(body)) {}

  StringRef getName() const override { return name; }
  bool usesState() const override { return stateful; }

  Error run(ExecutionContext& context,
            StateHolder<TestState>& holder) override {
    return body(context, holder);
  }
};

class StepRecorder : public BuildEventListener {
  std::mutex mutex;
  std::vector<std::string> descriptions;

public:
  void handleEvent(const BuildEvent& event) override {
    if (auto step = llvm::dyn_cast<StepEvent>(&event)) {
      std::lock_guard<std::mutex> guard(mutex);
      descriptions.push_back(step->describe());
    }
  }

  std::vector<std::string> getDescriptions() {
    std::lock_guard<std::mutex> guard(mutex);
    return descriptions;
  }
};

class RulePipelineRunnerTest : public ::testing::Test {
protected:
  std::string output;
  llvm::raw_string_ostream outputStream{output};
  IsolatedEventBus eventBus{"pipeline-test"};
  std::shared_ptr<StepRecorder> recorder = std::make_shared<StepRecorder>();
  std::shared_ptr<PluginLoaderCache> plugins =
    std::make_shared<PluginLoaderCache>();
  std::unique_ptr<ExecutionContext> context;

  int closeCount = 0;
  int factoryCalls = 0;
  std::vector<std::string> trace;

  void SetUp() override {
    eventBus.registerListener(recorder);
    context.reset(new ExecutionContext(
        Console(Verbosity::StandardInformation, outputStream, outputStream),
        eventBus,
        std::unique_ptr<ProcessExecutor>(
            new LocalProcessExecutor(outputStream, outputStream)),
        plugins, "/tmp"));
  }

  void TearDown() override {
    context.reset();
  }

  RulePipelineRunner<TestState>::StateFactory makeStateFactory() {
    return [this](ExecutionContext&) -> Expected<std::unique_ptr<TestState>> {
      ++factoryCalls;
      trace.push_back("create");
      return std::unique_ptr<TestState>(new TestState(closeCount));
    };
  }

  /// A stage which records its name, and whether it was first to use the
  /// state.
  std::unique_ptr<PipelineStage<TestState>> makeStage(StringRef name,
                                                      bool stateful = true) {
    std::string stageName = name.str();
    return std::unique_ptr<PipelineStage<TestState>>(new FunctionStage(
        name, stateful,
        [this, stageName, stateful](ExecutionContext&,
                                    StateHolder<TestState>& holder) {
          std::string entry = stageName;
          if (stateful) {
            holder.getState().uses++;
            entry += holder.isFirstStage() ? " (first)" : " (continuing)";
          } else {
            EXPECT_FALSE(holder.hasState());
          }
          trace.push_back(entry);
          return Error::success();
        }));
  }

  std::unique_ptr<PipelineStage<TestState>>
  makeStage(StringRef name, bool stateful, StageBody body) {
    return std::unique_ptr<PipelineStage<TestState>>(
        new FunctionStage(name, stateful, std::move(body)));
  }
};

TEST_F(RulePipelineRunnerTest, stagesShareState) {
  RulePipelineRunner<TestState> runner("javac", makeStateFactory());
  runner.addStage(makeStage("prepare", /*stateful=*/false));
  runner.addStage(makeStage("abi"));
  runner.addStage(makeStage("library"));
  EXPECT_EQ(3u, runner.getNumStages());
  EXPECT_EQ("javac", runner.getName());

  Error err = runner.run(*context);
  ASSERT_FALSE(bool(err)) << llvm::toString(std::move(err));

  // The state is created lazily, once, and released at the end.
  std::vector<std::string> expected{
    "prepare", "create", "abi (first)", "library (continuing)" };
  EXPECT_EQ(expected, trace);
  EXPECT_EQ(1, factoryCalls);
  EXPECT_EQ(1, closeCount);

  // Every stage ran in its own sub-context.
  EXPECT_EQ(1u, plugins->getRefCount());
  std::vector<std::string> steps{
    "started prepare", "finished prepare (exit code 0)",
    "started abi", "finished abi (exit code 0)",
    "started library", "finished library (exit code 0)" };
  EXPECT_EQ(steps, recorder->getDescriptions());
}

TEST_F(RulePipelineRunnerTest, stateNeverCreated) {
  RulePipelineRunner<TestState> runner("lint", makeStateFactory());
  runner.addStage(makeStage("check", /*stateful=*/false));

  Error err = runner.run(*context);
  ASSERT_FALSE(bool(err)) << llvm::toString(std::move(err));
  EXPECT_EQ(0, factoryCalls);
  EXPECT_EQ(0, closeCount);
}

TEST_F(RulePipelineRunnerTest, stateUnavailable) {
  RulePipelineRunner<TestState> runner(
      "javac", [](ExecutionContext&) -> Expected<std::unique_ptr<TestState>> {
        return std::unique_ptr<TestState>();
      });
  runner.addStage(makeStage("abi"));

  bool unavailable = false;
  llvm::handleAllErrors(
      runner.run(*context),
      [&](const StateUnavailableError& error) {
        unavailable = true;
        EXPECT_EQ("javac", error.getPipelineName());
        EXPECT_NE(std::string::npos, error.message().find(
                      "State could not be created in the current process"));
      },
      [&](const llvm::ErrorInfoBase& error) {
        ADD_FAILURE() << "unexpected error: " << error.message();
      });
  EXPECT_TRUE(unavailable);
  EXPECT_TRUE(trace.empty());
}

TEST_F(RulePipelineRunnerTest, stateCreationFailure) {
  RulePipelineRunner<TestState> runner(
      "javac", [](ExecutionContext&) -> Expected<std::unique_ptr<TestState>> {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "no compiler");
      });
  runner.addStage(makeStage("abi"));

  Error err = runner.run(*context);
  ASSERT_TRUE(bool(err));
  EXPECT_EQ("no compiler", llvm::toString(std::move(err)));
}

TEST_F(RulePipelineRunnerTest, stageFailureReleasesState) {
  RulePipelineRunner<TestState> runner("javac", makeStateFactory());
  runner.addStage(makeStage("abi"));
  runner.addStage(makeStage(
      "library", true,
      [](ExecutionContext&, StateHolder<TestState>&) -> Error {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "compilation failed");
      }));
  runner.addStage(makeStage("jar"));

  Error err = runner.run(*context);
  ASSERT_TRUE(bool(err));
  EXPECT_EQ("pipeline stage 'library': compilation failed",
            llvm::toString(std::move(err)));

  std::vector<std::string> expected{ "create", "abi (first)" };
  EXPECT_EQ(expected, trace);
  EXPECT_EQ(1, closeCount);
  EXPECT_EQ(1u, plugins->getRefCount());

  std::vector<std::string> steps = recorder->getDescriptions();
  ASSERT_EQ(4u, steps.size());
  EXPECT_EQ("finished library (exit code 1)", steps[3]);
}

TEST_F(RulePipelineRunnerTest, releaseFailureIsReported) {
  RulePipelineRunner<TestState> runner(
      "javac", [this](ExecutionContext&)
          -> Expected<std::unique_ptr<TestState>> {
        return std::unique_ptr<TestState>(
            new TestState(closeCount, "unable to stop compiler"));
      });
  runner.addStage(makeStage("abi"));

  Error err = runner.run(*context);
  ASSERT_TRUE(bool(err));
  EXPECT_EQ("unable to stop compiler", llvm::toString(std::move(err)));
  EXPECT_EQ(1, closeCount);
}

TEST_F(RulePipelineRunnerTest, cancellation) {
  RulePipelineRunner<TestState> runner("javac", makeStateFactory());
  runner.addStage(makeStage("abi"));
  runner.addStage(makeStage(
      "library", true,
      [&](ExecutionContext&, StateHolder<TestState>&) -> Error {
        trace.push_back("library");
        runner.cancel();
        return Error::success();
      }));
  runner.addStage(makeStage("jar"));

  EXPECT_FALSE(runner.isCancelled());
  Error err = runner.run(*context);
  ASSERT_TRUE(bool(err));
  EXPECT_EQ("pipeline 'javac' cancelled before stage 'jar'",
            llvm::toString(std::move(err)));
  EXPECT_TRUE(runner.isCancelled());

  std::vector<std::string> expected{ "create", "abi (first)", "library" };
  EXPECT_EQ(expected, trace);
  EXPECT_EQ(1, closeCount);
}

TEST_F(RulePipelineRunnerTest, stageOutputGoesToContextStreams) {
  RulePipelineRunner<TestState> runner("javac", makeStateFactory());
  runner.addStage(makeStage(
      "report", false,
      [](ExecutionContext& stageContext, StateHolder<TestState>&) -> Error {
        stageContext.getStdErr() << "from stage\n";
        EXPECT_EQ(Verbosity::StandardInformation,
                  stageContext.getVerbosity());
        EXPECT_EQ("/tmp", stageContext.getCellRoot());
        return Error::success();
      }));

  Error err = runner.run(*context);
  ASSERT_FALSE(bool(err)) << llvm::toString(std::move(err));
  EXPECT_EQ("from stage\n", outputStream.str());
}

}
