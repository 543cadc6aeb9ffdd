//===- HashFunction.h -------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_RULEKEY_HASHFUNCTION_H
#define RULEKIT_RULEKEY_HASHFUNCTION_H

#include "rulekit/Basic/Compiler.h"
#include "rulekit/Basic/LLVM.h"
#include "rulekit/RuleKey/HashCode.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/SHA1.h"
#include "llvm/Support/SHA256.h"

#include <cstdint>
#include <functional>
#include <memory>

namespace rulekit {
namespace rulekey {

/// The swappable hash primitive underneath the canonical rule key encoding.
///
/// A hash function absorbs raw bytes and produces a single digest. Instances
/// are single-use: once \see finish() has been called they must not be
/// updated again.
class HashFunction {
  // Copying is disabled.
  HashFunction(const HashFunction&) RULEKIT_DELETED_FUNCTION;
  void operator=(const HashFunction&) RULEKIT_DELETED_FUNCTION;

public:
  HashFunction() {}
  virtual ~HashFunction();

  /// Get the name of the algorithm, for diagnostics.
  virtual StringRef getName() const = 0;

  /// Absorb \arg data.
  virtual void update(ArrayRef<uint8_t> data) = 0;

  /// Finalize and return the digest.
  virtual HashCode finish() = 0;
};

/// SHA-1, the classic rule key digest (20 bytes).
class SHA1HashFunction : public HashFunction {
  llvm::SHA1 sha;

public:
  SHA1HashFunction() {}

  StringRef getName() const override { return "sha1"; }
  void update(ArrayRef<uint8_t> data) override { sha.update(data); }
  HashCode finish() override;
};

/// SHA-256 (32 bytes).
class SHA256HashFunction : public HashFunction {
  llvm::SHA256 sha;

public:
  SHA256HashFunction() {}

  StringRef getName() const override { return "sha256"; }
  void update(ArrayRef<uint8_t> data) override { sha.update(data); }
  HashCode finish() override;
};

/// A hash function whose "digest" is the complete input.
///
/// Used to obtain the exact canonical bytes of a value, e.g. to order mapping
/// entries or to record diagnostics.
class CapturingHashFunction : public HashFunction {
  SmallVector<uint8_t, 256> data;

public:
  CapturingHashFunction() {}

  StringRef getName() const override { return "capture"; }
  void update(ArrayRef<uint8_t> bytes) override {
    data.append(bytes.begin(), bytes.end());
  }
  HashCode finish() override;
};

enum class HashFunctionKind {
  SHA1 = 0,
  SHA256
};

/// Creates fresh hash function instances; one is consumed per rule key.
typedef std::function<std::unique_ptr<HashFunction>()> HashFunctionFactory;

std::unique_ptr<HashFunction> createHashFunction(HashFunctionKind kind);

HashFunctionFactory getHashFunctionFactory(HashFunctionKind kind);

StringRef getHashFunctionKindName(HashFunctionKind kind);

Optional<HashFunctionKind> parseHashFunctionKind(StringRef name);

}
}

#endif
