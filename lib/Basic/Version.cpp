//===-- Version.cpp -------------------------------------------------------===//
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

#include "rulekit/Basic/Version.h"

#include <string>

namespace rulekit {

std::string getRuleKitFullVersion(StringRef productName) {
  std::string result = productName.str() + " version 1.0";

  // Include the additional build version information, if present.
#ifdef RULEKIT_VENDOR_STRING
  result = std::string(RULEKIT_VENDOR_STRING) + " " + result;
#endif
#ifdef RULEKIT_VERSION_STRING
  result = result + " (" + std::string(RULEKIT_VERSION_STRING) + ")";
#endif

  return result;
}

unsigned getRuleKeyEncodingVersion() {
  return 1;
}

}
