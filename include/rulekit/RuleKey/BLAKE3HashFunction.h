//===- BLAKE3HashFunction.h -------------------------------------*- C++ -*-===//
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
// This header is only available when rulekit is built against libblake3.
//
//===----------------------------------------------------------------------===//

#ifndef RULEKIT_RULEKEY_BLAKE3HASHFUNCTION_H
#define RULEKIT_RULEKEY_BLAKE3HASHFUNCTION_H

#include "rulekit/RuleKey/HashFunction.h"

#include <memory>

namespace rulekit {
namespace rulekey {

/// BLAKE3 (32 byte output), the digest used by content-addressed stores.
class BLAKE3HashFunction : public HashFunction {
  struct Impl;
  std::unique_ptr<Impl> impl;

public:
  BLAKE3HashFunction();
  ~BLAKE3HashFunction() override;

  StringRef getName() const override { return "blake3"; }
  void update(ArrayRef<uint8_t> data) override;
  HashCode finish() override;
};

/// Get a factory producing BLAKE3 hash functions, for use with
/// \see RuleKeyFactory.
HashFunctionFactory getBLAKE3HashFunctionFactory();

}
}

#endif
