//===-- Console.cpp -------------------------------------------------------===//
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

#include "rulekit/Execution/Console.h"

#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"

using namespace rulekit;
using namespace rulekit::execution;

StringRef rulekit::execution::getVerbosityName(Verbosity verbosity) {
  switch (verbosity) {
  case Verbosity::Silent: return "silent";
  case Verbosity::StandardInformation: return "standard";
  case Verbosity::BinaryOutputs: return "binary-outputs";
  case Verbosity::Commands: return "commands";
  case Verbosity::CommandsAndOutput: return "commands-and-output";
  case Verbosity::All: return "all";
  }
  llvm_unreachable("invalid verbosity");
}

Optional<Verbosity> rulekit::execution::parseVerbosity(StringRef name) {
  return llvm::StringSwitch<Optional<Verbosity>>(name)
    .Cases("silent", "0", Verbosity::Silent)
    .Cases("standard", "1", Verbosity::StandardInformation)
    .Cases("binary-outputs", "2", Verbosity::BinaryOutputs)
    .Cases("commands", "3", Verbosity::Commands)
    .Cases("commands-and-output", "4", Verbosity::CommandsAndOutput)
    .Cases("all", "5", Verbosity::All)
    .Default(None);
}

Console Console::createDefault(Verbosity verbosity) {
  return Console(verbosity, llvm::outs(), llvm::errs(),
                 llvm::errs().has_colors());
}

void Console::printInfo(const Twine& message) const {
  if (!shouldPrintStandardInformation(verbosity))
    return;
  *stdErr << message << "\n";
}

void Console::printErrorText(const Twine& message) const {
  if (colors) {
    stdErr->enable_colors(true);
    stdErr->changeColor(raw_ostream::RED, /*Bold=*/true);
  }
  *stdErr << message;
  if (colors)
    stdErr->resetColor();
  *stdErr << "\n";
  stdErr->flush();
}

void Console::printBuildFailure(const Twine& message) const {
  printErrorText("BUILD FAILED: " + message);
}
