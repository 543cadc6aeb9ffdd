//===- Commands.h -----------------------------------------------*- C++ -*-===//
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
//
// This header describes the interfaces in the Commands rulekit library, which
// contains all of the command line tool implementations.
//
//===----------------------------------------------------------------------===//

#ifndef RULEKIT_COMMANDS_H
#define RULEKIT_COMMANDS_H

#include "rulekit/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace rulekit {
namespace commands {

/// Register the program name.
void setProgramName(StringRef name);

/// Get the registered program name.
const char* getProgramName();

int executeHashFileCommand(const std::vector<std::string> &args);
int executeCheckConfigCommand(const std::vector<std::string> &args);
int executeExecCommand(const std::vector<std::string> &args);

}
}

#endif
