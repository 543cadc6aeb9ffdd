//===-- BLAKE3HashFunction.cpp --------------------------------------------===//
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

#include "rulekit/RuleKey/BLAKE3HashFunction.h"

#include <blake3.h>

using namespace rulekit;
using namespace rulekit::rulekey;

struct BLAKE3HashFunction::Impl {
  blake3_hasher hasher;
};

BLAKE3HashFunction::BLAKE3HashFunction() : impl(new Impl()) {
  blake3_hasher_init(&impl->hasher);
}

BLAKE3HashFunction::~BLAKE3HashFunction() {}

void BLAKE3HashFunction::update(ArrayRef<uint8_t> data) {
  blake3_hasher_update(&impl->hasher, data.data(), data.size());
}

HashCode BLAKE3HashFunction::finish() {
  uint8_t digest[BLAKE3_OUT_LEN];
  blake3_hasher_finalize(&impl->hasher, digest, BLAKE3_OUT_LEN);
  return HashCode(StringRef(reinterpret_cast<const char*>(digest),
                            BLAKE3_OUT_LEN));
}

HashFunctionFactory rulekit::rulekey::getBLAKE3HashFunctionFactory() {
  return []() -> std::unique_ptr<HashFunction> {
    return std::unique_ptr<HashFunction>(new BLAKE3HashFunction());
  };
}
