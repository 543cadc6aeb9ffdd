//===-- Platform.cpp ------------------------------------------------------===//
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

#include "rulekit/Execution/Platform.h"

#include "llvm/ADT/Triple.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/Host.h"

using namespace rulekit;
using namespace rulekit::execution;

Platform rulekit::execution::getPlatformForTriple(const llvm::Triple& triple) {
  if (triple.isOSLinux())
    return Platform::Linux;
  if (triple.isMacOSX())
    return Platform::MacOS;
  if (triple.isOSWindows())
    return Platform::Windows;
  if (triple.isOSFreeBSD())
    return Platform::FreeBSD;
  return Platform::Unknown;
}

Platform rulekit::execution::detectPlatform() {
  return getPlatformForTriple(llvm::Triple(llvm::sys::getProcessTriple()));
}

StringRef rulekit::execution::getPlatformName(Platform platform) {
  switch (platform) {
  case Platform::Unknown: return "unknown";
  case Platform::Linux: return "linux";
  case Platform::MacOS: return "macos";
  case Platform::Windows: return "windows";
  case Platform::FreeBSD: return "freebsd";
  }
  llvm_unreachable("invalid platform");
}
