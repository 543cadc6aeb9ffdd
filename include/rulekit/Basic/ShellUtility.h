//===- ShellUtility.h -------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_BASIC_SHELLUTILITY_H
#define RULEKIT_BASIC_SHELLUTILITY_H

#include "rulekit/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include <string>

namespace rulekit {
namespace basic {

/// Append \arg string to \arg os, quoted for a POSIX shell if needed.
///
/// For example, hello -> hello, input A -> 'input A', it's -> 'it'\''s'.
void appendShellEscapedString(raw_ostream& os, StringRef string);

/// Get \arg string quoted for a POSIX shell if needed.
std::string shellEscaped(StringRef string);

/// Format \arg args as a single shell command line, for display.
std::string formatCommandLine(ArrayRef<std::string> args);

}
}

#endif
