//===-- HashCode.cpp ------------------------------------------------------===//
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

#include "rulekit/RuleKey/HashCode.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

#include <ostream>

using namespace rulekit;
using namespace rulekit::rulekey;

Optional<HashCode> HashCode::fromHex(StringRef hex) {
  if (hex.empty() || hex.size() % 2 != 0)
    return None;

  std::string bytes;
  if (!llvm::tryGetFromHex(hex, bytes))
    return None;
  return HashCode(bytes);
}

HashCode HashCode::fromInt(uint32_t value) {
  char bytes[4] = {
    char((value >> 24) & 0xFF), char((value >> 16) & 0xFF),
    char((value >> 8) & 0xFF), char(value & 0xFF) };
  return HashCode(StringRef(bytes, sizeof(bytes)));
}

std::string HashCode::toHex() const {
  return llvm::toHex(bytes, /*LowerCase=*/true);
}

RuleKey::RuleKey(StringRef hex) {
  auto parsed = HashCode::fromHex(hex);
  if (!parsed.hasValue()) {
    llvm::report_fatal_error("invalid rule key '" + hex + "'");
  }
  hashCode = std::move(*parsed);
}

RuleKey::RuleKey(const HashCode& hashCode) : hashCode(hashCode) {
  if (hashCode.isEmpty()) {
    llvm::report_fatal_error("invalid empty rule key");
  }
}

Optional<RuleKey> RuleKey::parse(StringRef hex) {
  auto parsed = HashCode::fromHex(hex);
  if (!parsed.hasValue())
    return None;
  return RuleKey(*parsed);
}

raw_ostream& rulekit::rulekey::operator<<(raw_ostream& os,
                                          const HashCode& value) {
  return os << value.toHex();
}

raw_ostream& rulekit::rulekey::operator<<(raw_ostream& os,
                                          const RuleKey& value) {
  return os << value.toString();
}

void rulekit::rulekey::PrintTo(const HashCode& value, std::ostream* os) {
  *os << value.toHex();
}

void rulekit::rulekey::PrintTo(const RuleKey& value, std::ostream* os) {
  *os << value.toString();
}
