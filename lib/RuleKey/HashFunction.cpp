//===-- HashFunction.cpp --------------------------------------------------===//
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

#include "rulekit/RuleKey/HashFunction.h"

#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"

using namespace rulekit;
using namespace rulekit::rulekey;

HashFunction::~HashFunction() {}

template<typename Digest>
static HashCode toHashCode(const Digest& digest) {
  return HashCode(StringRef(reinterpret_cast<const char*>(digest.data()),
                            digest.size()));
}

HashCode SHA1HashFunction::finish() {
  return toHashCode(sha.final());
}

HashCode SHA256HashFunction::finish() {
  return toHashCode(sha.final());
}

HashCode CapturingHashFunction::finish() {
  return HashCode(StringRef(reinterpret_cast<const char*>(data.data()),
                            data.size()));
}

std::unique_ptr<HashFunction>
rulekit::rulekey::createHashFunction(HashFunctionKind kind) {
  switch (kind) {
  case HashFunctionKind::SHA1:
    return std::unique_ptr<HashFunction>(new SHA1HashFunction());
  case HashFunctionKind::SHA256:
    return std::unique_ptr<HashFunction>(new SHA256HashFunction());
  }
  llvm_unreachable("invalid hash function kind");
}

HashFunctionFactory
rulekit::rulekey::getHashFunctionFactory(HashFunctionKind kind) {
  return [kind]() { return createHashFunction(kind); };
}

StringRef rulekit::rulekey::getHashFunctionKindName(HashFunctionKind kind) {
  switch (kind) {
  case HashFunctionKind::SHA1: return "sha1";
  case HashFunctionKind::SHA256: return "sha256";
  }
  llvm_unreachable("invalid hash function kind");
}

Optional<HashFunctionKind>
rulekit::rulekey::parseHashFunctionKind(StringRef name) {
  return llvm::StringSwitch<Optional<HashFunctionKind>>(name)
    .Case("sha1", HashFunctionKind::SHA1)
    .Case("sha256", HashFunctionKind::SHA256)
    .Default(None);
}
