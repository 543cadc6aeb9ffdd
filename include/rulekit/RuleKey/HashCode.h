//===- HashCode.h -----------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_RULEKEY_HASHCODE_H
#define RULEKIT_RULEKEY_HASHCODE_H

#include "rulekit/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <functional>
#include <string>

namespace rulekit {
namespace rulekey {

/// An immutable, byte-exact digest.
class HashCode {
  std::string bytes;

public:
  HashCode() {}
  explicit HashCode(StringRef bytes) : bytes(bytes.str()) {}

  /// Parse a hex encoded digest.
  ///
  /// \returns None if \arg hex is empty, of odd length, or contains a
  /// non-hex character.
  static Optional<HashCode> fromHex(StringRef hex);

  /// Create a four byte digest holding \arg value in big-endian order.
  static HashCode fromInt(uint32_t value);

  bool isEmpty() const { return bytes.empty(); }
  size_t size() const { return bytes.size(); }

  /// Get the raw digest bytes.
  StringRef getBytes() const { return bytes; }

  /// Get the lowercase hex representation.
  std::string toHex() const;

  bool operator==(const HashCode& rhs) const { return bytes == rhs.bytes; }
  bool operator!=(const HashCode& rhs) const { return bytes != rhs.bytes; }
  bool operator<(const HashCode& rhs) const { return bytes < rhs.bytes; }
};

/// The fingerprint of one build rule's complete cacheable identity.
///
/// Rule keys are opaque; two rules are interchangeable for caching purposes
/// iff their keys compare equal. The hex form is the key used by persistent
/// artifact caches, so it must remain stable across processes.
class RuleKey {
  HashCode hashCode;

public:
  /// Create a rule key from its hex representation.
  ///
  /// It is a fatal error to supply a malformed string; use \see parse() for
  /// untrusted input.
  explicit RuleKey(StringRef hex);

  /// Create a rule key from a finalized digest, which must not be empty.
  explicit RuleKey(const HashCode& hashCode);

  /// Parse a hex encoded rule key.
  static Optional<RuleKey> parse(StringRef hex);

  const HashCode& getHashCode() const { return hashCode; }

  /// Get the hex representation.
  std::string toString() const { return hashCode.toHex(); }

  bool operator==(const RuleKey& rhs) const { return hashCode == rhs.hashCode; }
  bool operator!=(const RuleKey& rhs) const { return hashCode != rhs.hashCode; }
  bool operator<(const RuleKey& rhs) const { return hashCode < rhs.hashCode; }
};

raw_ostream& operator<<(raw_ostream& os, const HashCode& value);
raw_ostream& operator<<(raw_ostream& os, const RuleKey& value);

// gtest pretty printing.
void PrintTo(const HashCode& value, std::ostream* os);
void PrintTo(const RuleKey& value, std::ostream* os);

}
}

namespace std
{
  template<>
  struct hash<rulekit::rulekey::RuleKey>
  {
    size_t operator()(const rulekit::rulekey::RuleKey& key) const
    {
      return hash<std::string>{}(key.getHashCode().getBytes().str());
    }
  };
}

#endif
