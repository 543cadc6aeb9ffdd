//===- BuildEvent.h ---------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_EXECUTION_BUILDEVENT_H
#define RULEKIT_EXECUTION_BUILDEVENT_H

#include "rulekit/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <memory>
#include <string>

namespace rulekit {
namespace execution {

/// An event posted to the build's event bus.
///
/// Events use LLVM-style RTTI; use \c llvm::dyn_cast to access a concrete
/// event. The posting time and build id are stamped by the bus.
class BuildEvent {
public:
  enum class Kind {
    Console,
    ErrorConsole,
    LastConsole = ErrorConsole,
    Step,
  };

private:
  Kind kind;
  uint64_t timestampMicros = 0;
  std::string buildId;
  bool configured = false;

protected:
  explicit BuildEvent(Kind kind) : kind(kind) {}

public:
  virtual ~BuildEvent();

  Kind getKind() const { return kind; }

  /// Record the posting time and build, once.
  void configure(uint64_t timestampMicros, StringRef buildId);

  bool isConfigured() const { return configured; }
  uint64_t getTimestampMicros() const { return timestampMicros; }
  StringRef getBuildId() const { return buildId; }

  /// Get a one line description, for logs.
  virtual std::string describe() const = 0;
};

/// A message for the console.
class ConsoleEvent : public BuildEvent {
public:
  enum class Level { Fine = 0, Info, Warning, Severe };

private:
  Level level;
  std::string message;

protected:
  ConsoleEvent(Kind kind, Level level, StringRef message)
    : BuildEvent(kind), level(level), message(message) {}

public:
  ConsoleEvent(Level level, StringRef message)
    : ConsoleEvent(Kind::Console, level, message) {}

  static std::shared_ptr<ConsoleEvent> info(StringRef message) {
    return std::make_shared<ConsoleEvent>(Level::Info, message);
  }
  static std::shared_ptr<ConsoleEvent> warning(StringRef message) {
    return std::make_shared<ConsoleEvent>(Level::Warning, message);
  }
  static std::shared_ptr<ConsoleEvent> severe(StringRef message) {
    return std::make_shared<ConsoleEvent>(Level::Severe, message);
  }

  Level getLevel() const { return level; }
  StringRef getMessage() const { return message; }

  std::string describe() const override;

  static bool classof(const BuildEvent* event) {
    return event->getKind() >= Kind::Console &&
      event->getKind() <= Kind::LastConsole;
  }
};

/// A severe console message carrying the text of an error.
class ErrorConsoleEvent : public ConsoleEvent {
  std::string errorText;

public:
  ErrorConsoleEvent(StringRef message, StringRef errorText)
    : ConsoleEvent(Kind::ErrorConsole, Level::Severe, message),
      errorText(errorText) {}

  StringRef getErrorText() const { return errorText; }

  std::string describe() const override;

  static bool classof(const BuildEvent* event) {
    return event->getKind() == Kind::ErrorConsole;
  }
};

/// The start or end of a build step.
class StepEvent : public BuildEvent {
public:
  enum class Phase { Started, Finished };

private:
  Phase phase;
  std::string shortName;
  std::string description;
  uint64_t stepId;
  Optional<int> exitCode;

public:
  StepEvent(Phase phase, StringRef shortName, StringRef description,
            uint64_t stepId, Optional<int> exitCode = None)
    : BuildEvent(Kind::Step), phase(phase), shortName(shortName),
      description(description), stepId(stepId), exitCode(exitCode) {}

  static std::shared_ptr<StepEvent> started(StringRef shortName,
                                            StringRef description,
                                            uint64_t stepId) {
    return std::make_shared<StepEvent>(Phase::Started, shortName, description,
                                       stepId);
  }

  static std::shared_ptr<StepEvent> finished(const StepEvent& started,
                                             int exitCode) {
    return std::make_shared<StepEvent>(Phase::Finished, started.shortName,
                                       started.description, started.stepId,
                                       exitCode);
  }

  Phase getPhase() const { return phase; }
  StringRef getShortName() const { return shortName; }
  StringRef getDescription() const { return description; }

  /// Get the id shared by the started and finished events of one step.
  uint64_t getStepId() const { return stepId; }

  /// Get the exit code, for finished events.
  Optional<int> getExitCode() const { return exitCode; }

  std::string describe() const override;

  static bool classof(const BuildEvent* event) {
    return event->getKind() == Kind::Step;
  }
};

/// Get a new process-unique step id.
uint64_t getNextStepId();

}
}

#endif
