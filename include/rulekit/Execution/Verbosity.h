//===- Verbosity.h ----------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_EXECUTION_VERBOSITY_H
#define RULEKIT_EXECUTION_VERBOSITY_H

#include "rulekit/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

namespace rulekit {
namespace execution {

/// How much a build step reports to the console, from least to most.
enum class Verbosity {
  Silent = 0,
  StandardInformation,
  BinaryOutputs,
  Commands,
  CommandsAndOutput,
  All,
};

inline bool isSilent(Verbosity verbosity) {
  return verbosity == Verbosity::Silent;
}

inline bool shouldPrintStandardInformation(Verbosity verbosity) {
  return verbosity >= Verbosity::StandardInformation;
}

inline bool shouldPrintBinaryRunInformation(Verbosity verbosity) {
  return verbosity >= Verbosity::BinaryOutputs;
}

inline bool shouldPrintCommand(Verbosity verbosity) {
  return verbosity >= Verbosity::Commands;
}

inline bool shouldPrintOutput(Verbosity verbosity) {
  return verbosity >= Verbosity::CommandsAndOutput;
}

StringRef getVerbosityName(Verbosity verbosity);

/// Parse a verbosity name (e.g. "commands") or level number (e.g. "3").
Optional<Verbosity> parseVerbosity(StringRef name);

}
}

#endif
