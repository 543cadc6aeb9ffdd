//===- Platform.h -----------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_EXECUTION_PLATFORM_H
#define RULEKIT_EXECUTION_PLATFORM_H

#include "rulekit/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

namespace llvm {
class Triple;
}

namespace rulekit {
namespace execution {

enum class Platform {
  Unknown = 0,
  Linux,
  MacOS,
  Windows,
  FreeBSD,
};

/// Get the platform of an LLVM target triple.
Platform getPlatformForTriple(const llvm::Triple& triple);

/// Get the platform this process is running on.
Platform detectPlatform();

StringRef getPlatformName(Platform platform);

}
}

#endif
