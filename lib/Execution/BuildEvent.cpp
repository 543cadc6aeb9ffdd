//===-- BuildEvent.cpp ----------------------------------------------------===//
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

#include "llvm/ADT/Twine.h"

#include <atomic>

using namespace rulekit;
using namespace rulekit::execution;

BuildEvent::~BuildEvent() {}

void BuildEvent::configure(uint64_t timestampMicros, StringRef buildId) {
  if (configured)
    return;
  this->timestampMicros = timestampMicros;
  this->buildId = buildId.str();
  configured = true;
}

static StringRef getLevelName(ConsoleEvent::Level level) {
  switch (level) {
  case ConsoleEvent::Level::Fine: return "fine";
  case ConsoleEvent::Level::Info: return "info";
  case ConsoleEvent::Level::Warning: return "warning";
  case ConsoleEvent::Level::Severe: return "severe";
  }
  return "unknown";
}

std::string ConsoleEvent::describe() const {
  return (getLevelName(level) + ": " + message).str();
}

std::string ErrorConsoleEvent::describe() const {
  return (ConsoleEvent::describe() + " (" + errorText + ")");
}

std::string StepEvent::describe() const {
  std::string result = (phase == Phase::Started ? "started " : "finished ");
  result += shortName;
  if (exitCode.hasValue())
    result += " (exit code " + std::to_string(*exitCode) + ")";
  return result;
}

uint64_t rulekit::execution::getNextStepId() {
  static std::atomic<uint64_t> nextId{1};
  return nextId++;
}
