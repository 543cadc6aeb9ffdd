//===- Console.h ------------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_EXECUTION_CONSOLE_H
#define RULEKIT_EXECUTION_CONSOLE_H

#include "rulekit/Basic/LLVM.h"
#include "rulekit/Execution/Verbosity.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/raw_ostream.h"

namespace rulekit {
namespace execution {

/// The output streams and verbosity of a build step.
///
/// The console does not own its streams.
class Console {
  Verbosity verbosity;
  raw_ostream* stdOut;
  raw_ostream* stdErr;
  bool colors;

public:
  Console(Verbosity verbosity, raw_ostream& stdOut, raw_ostream& stdErr,
          bool useColors = false)
    : verbosity(verbosity), stdOut(&stdOut), stdErr(&stdErr),
      colors(useColors) {}

  /// Create a console writing to the process's standard streams.
  static Console createDefault(Verbosity verbosity);

  Verbosity getVerbosity() const { return verbosity; }
  raw_ostream& getStdOut() const { return *stdOut; }
  raw_ostream& getStdErr() const { return *stdErr; }
  bool useColors() const { return colors; }

  /// Get a console with the same streams and a different verbosity.
  Console withVerbosity(Verbosity newVerbosity) const {
    return Console(newVerbosity, *stdOut, *stdErr, colors);
  }

  /// Get a console with the same settings writing to different streams.
  Console withStreams(raw_ostream& newStdOut, raw_ostream& newStdErr) const {
    return Console(verbosity, newStdOut, newStdErr, colors);
  }

  /// Print an informational line to stderr, unless silent.
  void printInfo(const Twine& message) const;

  /// Print an error line to stderr, in red when colors are enabled.
  void printErrorText(const Twine& message) const;

  /// Print a build failure message to stderr.
  void printBuildFailure(const Twine& message) const;
};

}
}

#endif
