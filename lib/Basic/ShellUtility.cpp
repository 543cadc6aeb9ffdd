//===-- ShellUtility.cpp --------------------------------------------------===//
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

#include "rulekit/Basic/ShellUtility.h"

#include "llvm/ADT/SmallString.h"

namespace rulekit {
namespace basic {

void appendShellEscapedString(raw_ostream& os, StringRef string) {
  static const char safeCharacters[] =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "1234567890-_/:@%+=.,";

  if (!string.empty() &&
      string.find_first_not_of(safeCharacters) == StringRef::npos) {
    os << string;
    return;
  }

  // Everything but the single quote is literal inside single quotes.
  os << "'";
  for (char c: string) {
    if (c == '\'')
      os << "'\\''";
    else
      os << c;
  }
  os << "'";
}

std::string shellEscaped(StringRef string) {
  SmallString<16> out;
  llvm::raw_svector_ostream os(out);
  appendShellEscapedString(os, string);
  return out.str().str();
}

std::string formatCommandLine(ArrayRef<std::string> args) {
  SmallString<256> out;
  llvm::raw_svector_ostream os(out);
  for (size_t i = 0, e = args.size(); i != e; ++i) {
    if (i != 0)
      os << " ";
    appendShellEscapedString(os, args[i]);
  }
  return out.str().str();
}

}
}
