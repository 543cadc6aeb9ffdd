//===- unittests/Execution/IsolatedEventBusTest.cpp -----------------------===//
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

#include "rulekit/Execution/BuildEvent.h"
#include "rulekit/Execution/IsolatedEventBus.h"

#include "llvm/Support/Casting.h"

#include "gtest/gtest.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace rulekit;
using namespace rulekit::execution;

namespace {

class RecordingListener : public BuildEventListener {
  std::mutex mutex;
  std::vector<std::string> events;

public:
  /// Called after each event is recorded, on the posting thread.
  std::function<void(const BuildEvent&)> onEvent;

  void handleEvent(const BuildEvent& event) override {
    {
      std::lock_guard<std::mutex> guard(mutex);
      events.push_back(event.describe());
    }
    if (onEvent)
      onEvent(event);
  }

  std::vector<std::string> getEvents() {
    std::lock_guard<std::mutex> guard(mutex);
    return events;
  }
};

class CountingListener : public BuildEventListener {
public:
  std::atomic<unsigned> count{0};

  void handleEvent(const BuildEvent&) override { ++count; }
};

TEST(BuildEventTest, describe) {
  EXPECT_EQ("info: compiling", ConsoleEvent::info("compiling")->describe());
  EXPECT_EQ("warning: slow", ConsoleEvent::warning("slow")->describe());
  EXPECT_EQ("severe: broken", ConsoleEvent::severe("broken")->describe());
  EXPECT_EQ("fine: detail",
            ConsoleEvent(ConsoleEvent::Level::Fine, "detail").describe());
  EXPECT_EQ("severe: javac failed (exit code 2)",
            ErrorConsoleEvent("javac failed", "exit code 2").describe());

  auto started = StepEvent::started("javac", "javac -d out A.java", 7);
  EXPECT_EQ("started javac", started->describe());
  EXPECT_FALSE(started->getExitCode().hasValue());

  auto finished = StepEvent::finished(*started, 2);
  EXPECT_EQ("finished javac (exit code 2)", finished->describe());
  EXPECT_EQ(StepEvent::Phase::Finished, finished->getPhase());
  EXPECT_EQ(7u, finished->getStepId());
  EXPECT_EQ("javac -d out A.java", finished->getDescription());
  EXPECT_EQ(2, *finished->getExitCode());
}

TEST(BuildEventTest, casting) {
  std::shared_ptr<BuildEvent> info = ConsoleEvent::info("x");
  std::shared_ptr<BuildEvent> error =
    std::make_shared<ErrorConsoleEvent>("x", "y");
  std::shared_ptr<BuildEvent> step = StepEvent::started("s", "d", 1);

  EXPECT_TRUE(llvm::isa<ConsoleEvent>(info.get()));
  EXPECT_FALSE(llvm::isa<ErrorConsoleEvent>(info.get()));
  EXPECT_TRUE(llvm::isa<ConsoleEvent>(error.get()));
  EXPECT_TRUE(llvm::isa<ErrorConsoleEvent>(error.get()));
  EXPECT_FALSE(llvm::isa<StepEvent>(error.get()));
  EXPECT_TRUE(llvm::isa<StepEvent>(step.get()));
  EXPECT_FALSE(llvm::isa<ConsoleEvent>(step.get()));
  EXPECT_EQ(ConsoleEvent::Level::Severe,
            llvm::cast<ConsoleEvent>(error.get())->getLevel());
}

TEST(BuildEventTest, stepIdsAreUnique) {
  uint64_t first = getNextStepId();
  uint64_t second = getNextStepId();
  EXPECT_NE(first, second);
}

TEST(IsolatedEventBusTest, registration) {
  IsolatedEventBus bus("build-1");
  EXPECT_EQ("build-1", bus.getBuildId());
  EXPECT_EQ(0u, bus.getNumListeners());

  auto listener = std::make_shared<RecordingListener>();
  bus.registerListener(listener);
  EXPECT_EQ(1u, bus.getNumListeners());

  bus.post(ConsoleEvent::info("one"));
  EXPECT_TRUE(bus.unregisterListener(*listener));
  EXPECT_FALSE(bus.unregisterListener(*listener));
  EXPECT_EQ(0u, bus.getNumListeners());
  bus.post(ConsoleEvent::info("two"));

  std::vector<std::string> expected{ "info: one" };
  EXPECT_EQ(expected, listener->getEvents());
  EXPECT_EQ(2u, bus.getNumPostedEvents());
}

TEST(IsolatedEventBusTest, postConfiguresEvents) {
  IsolatedEventBus bus("build-2");
  auto event = ConsoleEvent::info("hello");
  EXPECT_FALSE(event->isConfigured());

  bus.postWithTimestamp(event, 1234);
  EXPECT_TRUE(event->isConfigured());
  EXPECT_EQ(1234u, event->getTimestampMicros());
  EXPECT_EQ("build-2", event->getBuildId());

  // Reposting keeps the original stamp.
  IsolatedEventBus otherBus("build-3");
  otherBus.postWithTimestamp(event, 5678);
  EXPECT_EQ(1234u, event->getTimestampMicros());
  EXPECT_EQ("build-2", event->getBuildId());

  auto stamped = ConsoleEvent::info("now");
  bus.post(stamped);
  EXPECT_NE(0u, stamped->getTimestampMicros());
}

TEST(IsolatedEventBusTest, listenersMayReenterTheBus) {
  IsolatedEventBus bus("build-4");
  auto first = std::make_shared<RecordingListener>();
  auto late = std::make_shared<RecordingListener>();
  bus.registerListener(first);

  first->onEvent = [&](const BuildEvent& event) {
    auto console = llvm::dyn_cast<ConsoleEvent>(&event);
    if (!console || console->getMessage() != "outer")
      return;
    // Registered during dispatch; only sees later events.
    bus.registerListener(late);
    bus.post(ConsoleEvent::info("inner"));
  };

  bus.post(ConsoleEvent::info("outer"));

  std::vector<std::string> expectedFirst{ "info: outer", "info: inner" };
  EXPECT_EQ(expectedFirst, first->getEvents());
  std::vector<std::string> expectedLate{ "info: inner" };
  EXPECT_EQ(expectedLate, late->getEvents());
}

TEST(IsolatedEventBusTest, unregisterDuringDispatch) {
  IsolatedEventBus bus("build-5");
  auto first = std::make_shared<RecordingListener>();
  auto second = std::make_shared<RecordingListener>();
  bus.registerListener(first);
  bus.registerListener(second);

  first->onEvent = [&](const BuildEvent&) {
    bus.unregisterListener(*second);
  };

  // The event in flight still reaches the listener being removed.
  bus.post(ConsoleEvent::info("a"));
  bus.post(ConsoleEvent::info("b"));

  EXPECT_EQ(2u, first->getEvents().size());
  std::vector<std::string> expectedSecond{ "info: a" };
  EXPECT_EQ(expectedSecond, second->getEvents());
}

TEST(IsolatedEventBusTest, concurrentPosting) {
  IsolatedEventBus bus("build-6");
  auto counter = std::make_shared<CountingListener>();
  bus.registerListener(counter);

  const unsigned numThreads = 8, numEventsPerThread = 250;
  std::vector<std::thread> threads;
  for (unsigned i = 0; i != numThreads; ++i) {
    threads.emplace_back([&bus]() {
      for (unsigned j = 0; j != numEventsPerThread; ++j) {
        bus.post(StepEvent::started("step", "work", getNextStepId()));
      }
    });
  }
  for (auto& thread: threads)
    thread.join();

  EXPECT_EQ(numThreads * numEventsPerThread, counter->count.load());
  EXPECT_EQ(numThreads * numEventsPerThread, bus.getNumPostedEvents());
}

}
