//===- Version.h ------------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_BASIC_VERSION_H
#define RULEKIT_BASIC_VERSION_H

#include "rulekit/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>

namespace rulekit {

/// Get the version string.
///
/// \param productName The name of the product to embed in the string.
std::string getRuleKitFullVersion(StringRef productName = "rulekit");

/// The version of the canonical rule key encoding.
///
/// This is mixed into every rule key by the factory, so a change to the
/// encoding invalidates previously persisted keys instead of silently
/// aliasing them.
unsigned getRuleKeyEncodingVersion();

}

#endif
